#pragma once

#include <string>
#include <functional>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <map>
#include <set>
#include <deque>
#include <chrono>
#include <sw/redis++/redis++.h>
#include "pubsub_transport.hpp"

namespace namesys {

struct NameSysConfig;

// Redis-backed pub/sub transport shared by every node of a deployment.
// Topics map onto channels "pubsub:<topic>"; subscriber presence is tracked
// in the set "subs:<topic>" so peers can be listed per topic. Presence is
// advertised only after Redis has confirmed the channel subscription.
class RedisPubSub : public PubSubTransport {
public:
    static constexpr const char* CHANNEL_PREFIX = "pubsub:";
    static constexpr const char* PRESENCE_PREFIX = "subs:";

    RedisPubSub(const NameSysConfig& config, std::string peer_id, Bytes node_key);
    ~RedisPubSub() override;

    RedisPubSub(const RedisPubSub&) = delete;
    RedisPubSub& operator=(const RedisPubSub&) = delete;

    void subscribe(const std::string& topic, MessageHandler handler) override;

    // Returns once no handler for the topic is running.
    void unsubscribe(const std::string& topic) override;
    void publish(const std::string& topic, const std::string& data) override;
    std::vector<std::string> list_subscribers(const std::string& topic) override;
    std::string local_peer_id() const override { return peer_id_; }

    bool is_connected() const { return connected_; }

    // --- Envelope codec (exposed for tests) ---
    static std::string encode_envelope(const PubSubMessage& msg);
    // Returns false when the payload is not a well-formed envelope.
    static bool decode_envelope(const std::string& topic, const std::string& payload, PubSubMessage& out);

private:
    enum class PendingOp { SUBSCRIBE, UNSUBSCRIBE };

    std::unique_ptr<sw::redis::Redis> redis_;
    std::unique_ptr<sw::redis::Subscriber> subscriber_;

    std::string peer_id_;
    Bytes node_key_;
    int presence_ttl_sec_;
    std::chrono::seconds heartbeat_interval_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> seqno_{0};
    std::thread subscriber_thread_;

    std::map<std::string, MessageHandler> handlers_;
    std::set<std::string> confirmed_;   // Topics whose SUBSCRIBE Redis acknowledged
    std::deque<std::pair<PendingOp, std::string>> pending_;
    mutable std::mutex handlers_mutex_;

    // Held while a handler runs; recursive so a handler may unsubscribe.
    std::recursive_mutex dispatch_mutex_;

    void subscriber_loop();
    void apply_pending();
    void refresh_presence();
    void on_subscription_change(sw::redis::Subscriber::MsgType type, const std::string& channel);
    void advertise(const std::string& topic);
    void dispatch(const std::string& channel, const std::string& payload);
};

}
