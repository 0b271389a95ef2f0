#pragma once

#include <string>
#include <unordered_map>
#include <map>
#include <set>
#include <shared_mutex>
#include <mutex>
#include <memory>
#include <atomic>
#include <optional>
#include <chrono>
#include <functional>
#include "pubsub_transport.hpp"

namespace namesys {

// Bounded polling schedule for wait_for_remote_subscriber.
struct RetryPolicy {
    int attempts = 5;
    std::chrono::milliseconds interval{2000};
};

// Point-in-time view of one topic's subscription.
struct SubscriptionState {
    std::string topic;
    std::set<std::string> known_subscribers;
    bool message_received = false;
    size_t listener_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_message_at;
};

// Per-node registry of pub/sub topics and their listeners.
// The transport subscription for a topic is opened by the first listener and
// stays open after the last one leaves; only cancel() tears it down.
class SubscriptionTracker {
public:
    using Listener = std::function<void(const PubSubMessage&)>;
    using ListenerId = uint64_t;

    explicit SubscriptionTracker(PubSubTransport& transport);
    ~SubscriptionTracker();

    SubscriptionTracker(const SubscriptionTracker&) = delete;
    SubscriptionTracker& operator=(const SubscriptionTracker&) = delete;

    /**
     * Subscribes the topic on first use and registers an additional listener.
     * Idempotent with respect to the transport: a second call never resubscribes.
     * @return Handle for remove_listener().
     */
    ListenerId ensure_subscribed(const std::string& topic, Listener listener);

    void remove_listener(const std::string& topic, ListenerId id);

    // Drops every listener and unsubscribes from the transport.
    // Returns false if the topic was not subscribed.
    bool cancel(const std::string& topic);

    // Cancels every open topic. Once it returns, no transport callback
    // reaches a listener registered before the call.
    void cancel_all();

    bool is_subscribed(const std::string& topic) const;
    std::vector<std::string> topics() const;
    std::optional<SubscriptionState> state(const std::string& topic) const;

    /**
     * Polls the transport's subscriber list until a remote peer (or, when
     * `peer_hint` is non-empty, that specific peer) is subscribed to the topic.
     * @return The subscribers seen on the successful attempt.
     * @throws NoSubscriberFoundError once the policy's attempts are exhausted.
     */
    std::vector<std::string> wait_for_remote_subscriber(const std::string& topic,
                                                        const std::string& peer_hint,
                                                        const RetryPolicy& policy);

private:
    struct TopicEntry {
        std::mutex mutex;
        std::map<ListenerId, Listener> listeners;
        std::set<std::string> known_subscribers;
        bool message_received = false;
        std::optional<std::chrono::system_clock::time_point> last_message_at;
    };

    void dispatch(const std::string& topic, const PubSubMessage& msg);
    std::shared_ptr<TopicEntry> find_entry(const std::string& topic) const;

    PubSubTransport& transport_;
    std::unordered_map<std::string, std::shared_ptr<TopicEntry>> topics_;
    mutable std::shared_mutex topics_mutex_;
    std::atomic<ListenerId> next_id_{1};
};

}
