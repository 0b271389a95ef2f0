#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <memory>
#include <mutex>
#include <future>
#include <atomic>
#include <optional>
#include <chrono>
#include "namesys_config.hpp"
#include "key_store.hpp"
#include "name_cache.hpp"
#include "subscription_tracker.hpp"

namespace namesys {

struct ResolveOptions {
    // Unset uses NameSysConfig::default_resolve_timeout_ms; zero never waits.
    std::optional<std::chrono::milliseconds> timeout;
    // Ignore cached records of other identities and wait for live traffic.
    bool nocache = false;
};

// Resolves names to their current value: self -> cache -> subscribe -> await.
class NameResolver {
public:
    NameResolver(const NameSysConfig& config, KeyStore& keys, NameCache& cache, SubscriptionTracker& tracker);
    ~NameResolver();

    NameResolver(const NameResolver&) = delete;
    NameResolver& operator=(const NameResolver&) = delete;

    /**
     * Resolves "Qm..." or "/ipns/Qm..." to the record value.
     * @throws MalformedNameError, NotFoundError, ResolutionTimeoutError
     */
    std::string resolve(const std::string& name, const ResolveOptions& options = {});

    NameRecord resolve_record(const PeerId& id, const ResolveOptions& options = {});

    /**
     * Subscribes to the identity's topic and waits for the next validated record.
     * Skips the self and cache checks. A record cached or re-confirmed at or
     * after `since` counts as received. Returns nullopt on timeout.
     */
    std::optional<NameRecord> await_network(const PeerId& id, std::chrono::milliseconds timeout,
                                            NameCache::Clock::time_point since = NameCache::Clock::now());

    // Opens the identity's topic and feeds incoming records into the cache.
    void watch(const PeerId& id);

    // Forgets the cache feeder after the topic was cancelled.
    void forget(const PeerId& id);

    // Validates one pub/sub message for the identity and offers it to the cache.
    // Never throws; rejected messages are logged and counted.
    bool ingest(const PeerId& id, const PubSubMessage& msg);

private:
    struct Waiter {
        std::promise<NameRecord> promise;
        std::atomic<bool> fulfilled{false};
    };

    bool is_trusted(const NameCache::Entry& entry, NameCache::Clock::time_point now) const;
    void notify_waiters(const PeerId& id, const NameRecord& record);
    void remove_waiter(const PeerId& id, const std::shared_ptr<Waiter>& waiter);

    const NameSysConfig& config_;
    KeyStore& keys_;
    NameCache& cache_;
    SubscriptionTracker& tracker_;

    std::unordered_map<PeerId, std::vector<std::shared_ptr<Waiter>>> waiters_;
    std::mutex waiters_mutex_;

    // topic -> feeder listener installed by watch()
    std::unordered_map<std::string, SubscriptionTracker::ListenerId> feeders_;
    std::mutex feeders_mutex_;
};

}
