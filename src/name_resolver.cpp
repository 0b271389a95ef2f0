#include "name_resolver.hpp"
#include "topic_deriver.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"
#include "errors.hpp"
#include <algorithm>

namespace namesys {

NameResolver::NameResolver(const NameSysConfig& config, KeyStore& keys, NameCache& cache, SubscriptionTracker& tracker)
    : config_(config), keys_(keys), cache_(cache), tracker_(tracker) {}

NameResolver::~NameResolver() {
    std::lock_guard<std::mutex> lock(feeders_mutex_);
    for (const auto& [topic, listener] : feeders_) {
        tracker_.remove_listener(topic, listener);
    }
}

std::string NameResolver::resolve(const std::string& name, const ResolveOptions& options) {
    return resolve_record(PeerId::parse(name), options).value_string();
}

NameRecord NameResolver::resolve_record(const PeerId& id, const ResolveOptions& options) {
    auto& metrics = MetricsRegistry::instance();
    metrics.increment_counter("resolve_total");
    auto now = NameCache::Clock::now();
    auto cached = cache_.get(id, now);

    // Self-resolution never waits on the network
    if (cached && keys_.find(id)) {
        metrics.increment_counter("resolve_cache_hits_total");
        return cached->record;
    }

    if (cached && !options.nocache && is_trusted(*cached, now)) {
        metrics.increment_counter("resolve_cache_hits_total");
        return cached->record;
    }

    auto timeout = options.timeout.value_or(std::chrono::milliseconds(config_.default_resolve_timeout_ms));
    if (timeout <= std::chrono::milliseconds::zero()) {
        watch(id);
        if (cached && !options.nocache) {
            metrics.increment_counter("resolve_cache_hits_total");
            return cached->record;
        }
        throw NotFoundError("No record for " + id.to_string() + " yet; now subscribed to " +
                            TopicDeriver::derive_topic(id));
    }

    auto record = await_network(id, timeout, now);
    if (!record) {
        metrics.increment_counter("resolve_timeouts_total");
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::RESOLVE_TIMEOUT,
                         id.to_string(), "No valid record within " + std::to_string(timeout.count()) + "ms");
        throw ResolutionTimeoutError("Timed out resolving " + id.to_string() + " after " +
                                     std::to_string(timeout.count()) + "ms");
    }
    return *record;
}

std::optional<NameRecord> NameResolver::await_network(const PeerId& id, std::chrono::milliseconds timeout,
                                                      NameCache::Clock::time_point since) {
    auto waiter = std::make_shared<Waiter>();
    auto future = waiter->promise.get_future();
    {
        std::lock_guard<std::mutex> lock(waiters_mutex_);
        waiters_[id].push_back(waiter);
    }

    try {
        watch(id);
    } catch (...) {
        remove_waiter(id, waiter);
        throw;
    }

    // A record may have landed between the caller's cache check and registration
    if (auto entry = cache_.get(id); entry && entry->confirmed_at >= since) {
        remove_waiter(id, waiter);
        return entry->record;
    }

    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }

    remove_waiter(id, waiter);
    // Fulfilment can race the timeout
    if (future.wait_for(std::chrono::milliseconds::zero()) == std::future_status::ready) {
        return future.get();
    }
    return std::nullopt;
}

void NameResolver::watch(const PeerId& id) {
    std::string topic = TopicDeriver::derive_topic(id);
    std::lock_guard<std::mutex> lock(feeders_mutex_);
    if (feeders_.count(topic) && tracker_.is_subscribed(topic)) return;

    feeders_[topic] = tracker_.ensure_subscribed(topic, [this, id](const PubSubMessage& msg) {
        ingest(id, msg);
    });
}

void NameResolver::forget(const PeerId& id) {
    std::lock_guard<std::mutex> lock(feeders_mutex_);
    feeders_.erase(TopicDeriver::derive_topic(id));
}

bool NameResolver::ingest(const PeerId& id, const PubSubMessage& msg) {
    auto& metrics = MetricsRegistry::instance();
    std::string name = id.to_string();

    NameRecord record;
    try {
        record = RecordCodec::unmarshal(msg.data);
    } catch (const MalformedRecordError& e) {
        metrics.increment_counter("messages_malformed_total");
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::MALFORMED_MESSAGE,
                         name, std::string(e.what()) + " (from " + msg.from + ")");
        return false;
    }

    try {
        RecordCodec::validate_for(record, id);
    } catch (const NameSysError& e) {
        // Forged, corrupted or stale records never reach the cache
        metrics.increment_counter("records_rejected_total");
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::RECORD_REJECTED,
                         name, std::string(e.what()) + " (from " + msg.from + ")");
        return false;
    }

    auto result = cache_.offer(id, record, NameCache::Origin::NETWORK);
    if (result == NameCache::OfferResult::IGNORED) return false;

    bool advanced = result == NameCache::OfferResult::ADVANCED;
    if (advanced) {
        metrics.increment_counter("records_accepted_total");
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::RECORD_ACCEPTED,
                         name, "seq=" + std::to_string(record.sequence));
    }

    // Only fresh or re-confirmed records wake waiters
    if (auto entry = cache_.get(id)) {
        notify_waiters(id, entry->record);
    }
    return advanced;
}

bool NameResolver::is_trusted(const NameCache::Entry& entry, NameCache::Clock::time_point now) const {
    if (entry.origin == NameCache::Origin::LOCAL) return true;
    return now - entry.confirmed_at < std::chrono::seconds(config_.cache_trust_sec);
}

void NameResolver::notify_waiters(const PeerId& id, const NameRecord& record) {
    std::vector<std::shared_ptr<Waiter>> ready;
    {
        std::lock_guard<std::mutex> lock(waiters_mutex_);
        auto it = waiters_.find(id);
        if (it == waiters_.end()) return;
        ready.swap(it->second);
        waiters_.erase(it);
    }
    for (auto& waiter : ready) {
        if (!waiter->fulfilled.exchange(true)) {
            waiter->promise.set_value(record);
        }
    }
}

void NameResolver::remove_waiter(const PeerId& id, const std::shared_ptr<Waiter>& waiter) {
    std::lock_guard<std::mutex> lock(waiters_mutex_);
    auto it = waiters_.find(id);
    if (it == waiters_.end()) return;
    auto& list = it->second;
    list.erase(std::remove(list.begin(), list.end(), waiter), list.end());
    if (list.empty()) waiters_.erase(it);
}

}
