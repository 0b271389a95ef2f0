#include "transport/loopback_pubsub.hpp"
#include "errors.hpp"
#include "event_logger.hpp"

namespace namesys {

std::unique_ptr<LoopbackPubSub> LoopbackHub::connect(const std::string& peer_id, const Bytes& node_key) {
    return std::make_unique<LoopbackPubSub>(shared_from_this(), peer_id, node_key);
}

size_t LoopbackHub::endpoint_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoints_.size();
}

void LoopbackHub::attach(LoopbackPubSub* endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_.insert(endpoint);
}

void LoopbackHub::detach(LoopbackPubSub* endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_.erase(endpoint);
}

// Collects the receiving handlers under the hub lock, then invokes them unlocked.
void LoopbackHub::deliver(const LoopbackPubSub* sender, const PubSubMessage& msg) {
    std::vector<PubSubTransport::MessageHandler> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto* endpoint : endpoints_) {
            if (endpoint == sender) continue;
            if (auto handler = endpoint->handler_for(msg.topic)) {
                targets.push_back(std::move(handler));
            }
        }
    }

    for (auto& handler : targets) {
        try {
            handler(msg);
        } catch (const std::exception& e) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::TRANSPORT_ERROR,
                             msg.from, "Loopback handler failed: " + std::string(e.what()));
        }
    }
}

std::vector<std::string> LoopbackHub::subscribers_of(const std::string& topic, const LoopbackPubSub* except) const {
    std::vector<std::string> peers;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto* endpoint : endpoints_) {
        if (endpoint != except && endpoint->is_subscribed(topic)) {
            peers.push_back(endpoint->local_peer_id());
        }
    }
    return peers;
}

LoopbackPubSub::LoopbackPubSub(std::shared_ptr<LoopbackHub> hub, std::string peer_id, Bytes node_key)
    : hub_(std::move(hub)), peer_id_(std::move(peer_id)), node_key_(std::move(node_key)) {
    hub_->attach(this);
}

LoopbackPubSub::~LoopbackPubSub() {
    hub_->detach(this);
}

void LoopbackPubSub::subscribe(const std::string& topic, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[topic] = std::move(handler);
}

void LoopbackPubSub::unsubscribe(const std::string& topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(topic);
}

void LoopbackPubSub::publish(const std::string& topic, const std::string& data) {
    if (offline_) {
        throw TransportError("Loopback endpoint " + peer_id_ + " is offline");
    }
    PubSubMessage msg;
    msg.topic = topic;
    msg.from = peer_id_;
    msg.key = node_key_;
    msg.seqno = ++seqno_;
    msg.data = data;
    hub_->deliver(this, msg);
}

std::vector<std::string> LoopbackPubSub::list_subscribers(const std::string& topic) {
    return hub_->subscribers_of(topic, this);
}

bool LoopbackPubSub::is_subscribed(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(topic) > 0;
}

PubSubTransport::MessageHandler LoopbackPubSub::handler_for(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(topic);
    return it != handlers_.end() ? it->second : MessageHandler{};
}

}
