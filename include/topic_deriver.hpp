#pragma once

#include <string>
#include <optional>
#include "peer_id.hpp"

namespace namesys {

// Maps a peer identity to the pub/sub topic its records travel on.
// topic = "/record/" + base64url("/ipns/" + multihash bytes), unpadded.
class TopicDeriver {
public:
    static constexpr const char* TOPIC_PREFIX = "/record/";
    static constexpr const char* ROUTING_PREFIX = "/ipns/";

    static Bytes routing_key(const PeerId& id);

    static std::string derive_topic(const PeerId& id);

    // Inverse of derive_topic for topics in the record namespace.
    static std::optional<PeerId> peer_of_topic(const std::string& topic);

    static bool is_record_topic(const std::string& topic) {
        return topic.rfind(TOPIC_PREFIX, 0) == 0;
    }
};

}
