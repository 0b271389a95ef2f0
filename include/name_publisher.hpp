#pragma once

#include <string>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <optional>
#include <chrono>
#include "namesys_config.hpp"
#include "key_store.hpp"
#include "name_cache.hpp"
#include "name_resolver.hpp"
#include "pubsub_transport.hpp"

namespace namesys {

struct PublishOptions {
    // Recover the previous sequence from the network when nothing is cached locally.
    bool resolve = true;
    std::string key = "self";
    std::optional<std::chrono::seconds> lifetime;
    std::optional<std::chrono::seconds> ttl;
};

struct PublishResult {
    std::string name;
    std::string value;
    uint64_t sequence = 0;
};

// Builds, broadcasts and locally caches records for keys this node controls.
// Broadcast is best-effort: success means the transport accepted the bytes.
class NamePublisher {
public:
    NamePublisher(const NameSysConfig& config, KeyStore& keys, NameCache& cache,
                  PubSubTransport& transport, NameResolver& resolver);

    NamePublisher(const NamePublisher&) = delete;
    NamePublisher& operator=(const NamePublisher&) = delete;

    /**
     * Publishes `value` under the key named in the options.
     * @throws SigningError for an unknown or unusable key.
     * @throws PublishError for an invalid value or a transport failure.
     */
    PublishResult publish(const std::string& value, const PublishOptions& options = {});

    // Re-issues the cached value of a key with the next sequence and a fresh validity.
    // Returns nullopt when the key has no cached record.
    std::optional<PublishResult> republish(const std::string& key_name);

    // Caches a sequence-0 record locally without broadcasting it.
    // Does nothing if the key already has a record.
    bool initialize(const std::string& key_name, const std::string& value);

    // "Qm..." becomes "/ipfs/Qm..."; absolute paths are kept.
    static std::string normalize_value(const std::string& value);

private:
    NameRecord build_next(const Ed25519Key& key, const PeerId& id, const std::string& value,
                          std::chrono::seconds lifetime, std::chrono::seconds ttl);
    void broadcast(const PeerId& id, const NameRecord& record);
    std::shared_ptr<std::mutex> lock_for(const PeerId& id);

    const NameSysConfig& config_;
    KeyStore& keys_;
    NameCache& cache_;
    PubSubTransport& transport_;
    NameResolver& resolver_;

    std::unordered_map<PeerId, std::shared_ptr<std::mutex>> publish_locks_;
    std::mutex locks_mutex_;
};

}
