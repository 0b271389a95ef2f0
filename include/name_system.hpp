#pragma once

#include <string>
#include <vector>
#include <optional>
#include "namesys_config.hpp"
#include "key_store.hpp"
#include "name_cache.hpp"
#include "subscription_tracker.hpp"
#include "name_resolver.hpp"
#include "name_publisher.hpp"
#include "pubsub_transport.hpp"

namespace namesys {

// One node's name system: cache, subscriptions, resolver and publisher wired
// to a shared pub/sub transport and the node's key store.
class NameSystem {
public:
    // Path every fresh node initially points its own name at.
    static constexpr const char* EMPTY_DIRECTORY_PATH = "/ipfs/QmUNLLsPACCz1vLxQVkXqqLX5R1X345qqfHbsf67hvA3Nn";

    NameSystem(const NameSysConfig& config, PubSubTransport& transport, KeyStore& keys);
    ~NameSystem();

    NameSystem(const NameSystem&) = delete;
    NameSystem& operator=(const NameSystem&) = delete;

    // Caches a local-only record for the node key pointing at the empty directory.
    void initialize_keyspace();

    PublishResult publish(const std::string& value, const PublishOptions& options = {});
    std::string resolve(const std::string& name, const ResolveOptions& options = {});

    // Subscribes to a name's topic without resolving it.
    void watch(const std::string& name);

    // Names with an open record subscription, as /ipns/ paths.
    std::vector<std::string> subscriptions() const;

    // Closes the subscription for a name. Returns false if none was open.
    bool cancel(const std::string& name);

    /**
     * Waits until a remote peer subscribes to the name's topic.
     * @throws NoSubscriberFoundError
     */
    std::vector<std::string> wait_for_subscriber(const std::string& name, const std::string& peer_hint = "",
                                                 std::optional<RetryPolicy> policy = std::nullopt);

    static std::string topic_for(const std::string& name);

    PeerId self_id() const;
    size_t evict_expired() { return cache_.evict_expired(); }

    const NameSysConfig& config() const { return config_; }
    NameCache& cache() { return cache_; }
    SubscriptionTracker& tracker() { return tracker_; }
    NameResolver& resolver() { return resolver_; }
    NamePublisher& publisher() { return publisher_; }

private:
    NameSysConfig config_;
    PubSubTransport& transport_;
    KeyStore& keys_;
    NameCache cache_;
    SubscriptionTracker tracker_;
    NameResolver resolver_;
    NamePublisher publisher_;
};

}
