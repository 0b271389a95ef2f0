#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <atomic>
#include "pubsub_transport.hpp"

namespace namesys {

class LoopbackPubSub;

// In-process pub/sub fabric: every endpoint attached to the same hub
// sees the others' publications. Delivery runs on the publisher's thread.
class LoopbackHub : public std::enable_shared_from_this<LoopbackHub> {
public:
    static std::shared_ptr<LoopbackHub> create() {
        return std::shared_ptr<LoopbackHub>(new LoopbackHub());
    }

    // Creates an endpoint for a node identified by `peer_id` and its node key.
    std::unique_ptr<LoopbackPubSub> connect(const std::string& peer_id, const Bytes& node_key);

    size_t endpoint_count() const;

private:
    friend class LoopbackPubSub;

    LoopbackHub() = default;

    void attach(LoopbackPubSub* endpoint);
    void detach(LoopbackPubSub* endpoint);
    void deliver(const LoopbackPubSub* sender, const PubSubMessage& msg);
    std::vector<std::string> subscribers_of(const std::string& topic, const LoopbackPubSub* except) const;

    std::set<LoopbackPubSub*> endpoints_;
    mutable std::mutex mutex_;
};

class LoopbackPubSub : public PubSubTransport {
public:
    LoopbackPubSub(std::shared_ptr<LoopbackHub> hub, std::string peer_id, Bytes node_key);
    ~LoopbackPubSub() override;

    LoopbackPubSub(const LoopbackPubSub&) = delete;
    LoopbackPubSub& operator=(const LoopbackPubSub&) = delete;

    void subscribe(const std::string& topic, MessageHandler handler) override;
    void unsubscribe(const std::string& topic) override;
    void publish(const std::string& topic, const std::string& data) override;
    std::vector<std::string> list_subscribers(const std::string& topic) override;
    std::string local_peer_id() const override { return peer_id_; }

    // Simulates a broken link: publish throws TransportError while set.
    void set_offline(bool offline) { offline_ = offline; }

    bool is_subscribed(const std::string& topic) const;

private:
    friend class LoopbackHub;

    // Returns a copy so that the handler runs without the endpoint lock.
    MessageHandler handler_for(const std::string& topic) const;

    std::shared_ptr<LoopbackHub> hub_;
    std::string peer_id_;
    Bytes node_key_;
    std::map<std::string, MessageHandler> handlers_;
    mutable std::mutex mutex_;
    std::atomic<uint64_t> seqno_{0};
    std::atomic<bool> offline_{false};
};

}
