#include "topic_deriver.hpp"
#include "errors.hpp"
#include <cstring>

namespace namesys {

Bytes TopicDeriver::routing_key(const PeerId& id) {
    Bytes key(ROUTING_PREFIX, ROUTING_PREFIX + std::strlen(ROUTING_PREFIX));
    key.insert(key.end(), id.bytes().begin(), id.bytes().end());
    return key;
}

std::string TopicDeriver::derive_topic(const PeerId& id) {
    return std::string(TOPIC_PREFIX) + encoding::base64url_encode(routing_key(id));
}

std::optional<PeerId> TopicDeriver::peer_of_topic(const std::string& topic) {
    if (!is_record_topic(topic)) return std::nullopt;

    std::string body = topic.substr(std::strlen(TOPIC_PREFIX));
    for (auto& c : body) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
    }
    while (body.size() % 4 != 0) body += '=';

    auto decoded = encoding::base64_decode(body);
    size_t prefix_len = std::strlen(ROUTING_PREFIX);
    if (!decoded || decoded->size() <= prefix_len ||
        std::memcmp(decoded->data(), ROUTING_PREFIX, prefix_len) != 0) {
        return std::nullopt;
    }
    try {
        return PeerId::from_bytes(Bytes(decoded->begin() + prefix_len, decoded->end()));
    } catch (const MalformedNameError&) {
        return std::nullopt;
    }
}

}
