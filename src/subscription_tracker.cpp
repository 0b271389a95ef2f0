#include "subscription_tracker.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"
#include "errors.hpp"
#include <algorithm>
#include <thread>
#include <vector>

namespace namesys {

SubscriptionTracker::SubscriptionTracker(PubSubTransport& transport)
    : transport_(transport) {}

// Transport handlers capture `this`; they must be gone before the tracker is.
SubscriptionTracker::~SubscriptionTracker() {
    cancel_all();
}

void SubscriptionTracker::cancel_all() {
    std::vector<std::string> open_topics;
    {
        std::unique_lock lock(topics_mutex_);
        for (const auto& [topic, entry] : topics_) open_topics.push_back(topic);
        topics_.clear();
    }
    for (const auto& topic : open_topics) {
        try {
            transport_.unsubscribe(topic);
            MetricsRegistry::instance().decrement_gauge("active_topics");
            EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::UNSUBSCRIBED, topic);
        } catch (const std::exception& e) {
            EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::TRANSPORT_ERROR,
                             topic, "Unsubscribe failed: " + std::string(e.what()));
        }
    }
}

std::shared_ptr<SubscriptionTracker::TopicEntry> SubscriptionTracker::find_entry(const std::string& topic) const {
    std::shared_lock lock(topics_mutex_);
    auto it = topics_.find(topic);
    return it != topics_.end() ? it->second : nullptr;
}

SubscriptionTracker::ListenerId SubscriptionTracker::ensure_subscribed(const std::string& topic, Listener listener) {
    ListenerId id = next_id_++;

    std::unique_lock lock(topics_mutex_);
    auto& entry = topics_[topic];
    bool first = !entry;
    if (first) {
        entry = std::make_shared<TopicEntry>();
    }
    {
        std::lock_guard<std::mutex> entry_lock(entry->mutex);
        entry->listeners.emplace(id, std::move(listener));
    }

    if (first) {
        try {
            transport_.subscribe(topic, [this, topic](const PubSubMessage& msg) {
                dispatch(topic, msg);
            });
        } catch (...) {
            topics_.erase(topic);
            throw;
        }
        MetricsRegistry::instance().increment_gauge("active_topics");
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::SUBSCRIBED, topic);
    }
    return id;
}

// Leaves the transport subscription open even when no listener remains:
// another waiter may be racing to register on the same topic.
void SubscriptionTracker::remove_listener(const std::string& topic, ListenerId id) {
    auto entry = find_entry(topic);
    if (!entry) return;
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->listeners.erase(id);
}

bool SubscriptionTracker::cancel(const std::string& topic) {
    {
        std::unique_lock lock(topics_mutex_);
        if (topics_.erase(topic) == 0) return false;
    }
    transport_.unsubscribe(topic);
    MetricsRegistry::instance().decrement_gauge("active_topics");
    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::UNSUBSCRIBED, topic);
    return true;
}

bool SubscriptionTracker::is_subscribed(const std::string& topic) const {
    return find_entry(topic) != nullptr;
}

std::vector<std::string> SubscriptionTracker::topics() const {
    std::shared_lock lock(topics_mutex_);
    std::vector<std::string> out;
    out.reserve(topics_.size());
    for (const auto& [topic, entry] : topics_) out.push_back(topic);
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<SubscriptionState> SubscriptionTracker::state(const std::string& topic) const {
    auto entry = find_entry(topic);
    if (!entry) return std::nullopt;

    std::lock_guard<std::mutex> lock(entry->mutex);
    SubscriptionState snapshot;
    snapshot.topic = topic;
    snapshot.known_subscribers = entry->known_subscribers;
    snapshot.message_received = entry->message_received;
    snapshot.listener_count = entry->listeners.size();
    snapshot.last_message_at = entry->last_message_at;
    return snapshot;
}

// Fans a transport message out to every listener. Listener failures stay local.
void SubscriptionTracker::dispatch(const std::string& topic, const PubSubMessage& msg) {
    auto entry = find_entry(topic);
    if (!entry) return;

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->message_received = true;
        entry->last_message_at = std::chrono::system_clock::now();
        if (!msg.from.empty()) entry->known_subscribers.insert(msg.from);
        listeners.reserve(entry->listeners.size());
        for (const auto& [id, listener] : entry->listeners) listeners.push_back(listener);
    }

    for (const auto& listener : listeners) {
        try {
            listener(msg);
        } catch (const std::exception& e) {
            EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::TRANSPORT_ERROR,
                             topic, "Listener failed: " + std::string(e.what()));
        }
    }
}

std::vector<std::string> SubscriptionTracker::wait_for_remote_subscriber(const std::string& topic,
                                                                         const std::string& peer_hint,
                                                                         const RetryPolicy& policy) {
    for (int attempt = 1; attempt <= std::max(1, policy.attempts); ++attempt) {
        auto peers = transport_.list_subscribers(topic);

        if (auto entry = find_entry(topic)) {
            std::lock_guard<std::mutex> lock(entry->mutex);
            entry->known_subscribers.insert(peers.begin(), peers.end());
        }

        bool found = peer_hint.empty()
            ? !peers.empty()
            : std::find(peers.begin(), peers.end(), peer_hint) != peers.end();
        if (found) return peers;

        if (attempt < policy.attempts) {
            std::this_thread::sleep_for(policy.interval);
        }
    }
    throw NoSubscriberFoundError("Could not find subscription for topic " + topic);
}

}
