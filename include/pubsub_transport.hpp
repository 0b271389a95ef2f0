#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>
#include "encoding.hpp"

namespace namesys {

// A message as delivered by the pub/sub layer.
// `from` and `key` identify the forwarding node, not the record's signer.
struct PubSubMessage {
    std::string topic;
    std::string from;
    Bytes key;
    uint64_t seqno = 0;
    std::string data;
};

// Generic topic-based publish/subscribe primitives consumed by the name system.
class PubSubTransport {
public:
    using MessageHandler = std::function<void(const PubSubMessage&)>;

    virtual ~PubSubTransport() = default;

    // Replaces any handler previously installed for the topic.
    virtual void subscribe(const std::string& topic, MessageHandler handler) = 0;

    virtual void unsubscribe(const std::string& topic) = 0;

    // Hands the payload to the transport. Throws TransportError when that is impossible.
    virtual void publish(const std::string& topic, const std::string& data) = 0;

    // Remote peers currently subscribed to the topic.
    virtual std::vector<std::string> list_subscribers(const std::string& topic) = 0;

    virtual std::string local_peer_id() const = 0;
};

}
