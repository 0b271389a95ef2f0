#pragma once

#include <string>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <memory>
#include <optional>
#include <chrono>
#include "peer_id.hpp"
#include "record_codec.hpp"

namespace namesys {

// Last-known-good record per identity.
// Entries are locked individually; the map lock only guards membership.
class NameCache {
public:
    using Clock = std::chrono::system_clock;

    enum class Origin {
        LOCAL,      // Written by this node's publisher
        NETWORK     // Validated record received from the pub/sub layer
    };

    enum class OfferResult {
        ADVANCED,   // Record replaced the cached entry
        CONFIRMED,  // Record equals the cached entry; confirmation time refreshed
        IGNORED     // Expired, or not newer than a live entry
    };

    struct Entry {
        NameRecord record;
        Clock::time_point recorded_at;
        Clock::time_point confirmed_at;    // Last time this exact record was seen again
        Clock::time_point expires_at;
        Origin origin = Origin::NETWORK;
    };

    NameCache() = default;

    NameCache(const NameCache&) = delete;
    NameCache& operator=(const NameCache&) = delete;

    /**
     * Stores the record if its sequence is strictly greater than the cached one,
     * or if nothing (or only an expired entry) is cached. Receiving the cached
     * record again refreshes its confirmation time without advancing.
     * The caller must have validated the record.
     */
    OfferResult offer(const PeerId& id, const NameRecord& record, Origin origin,
               Clock::time_point now = Clock::now());

    // Unexpired entry for the identity, if any.
    std::optional<Entry> get(const PeerId& id, Clock::time_point now = Clock::now()) const;

    // Highest sequence ever cached for the identity, expired or not.
    std::optional<uint64_t> last_sequence(const PeerId& id) const;

    // Removes entries whose validity has passed. Returns the number removed.
    size_t evict_expired(Clock::time_point now = Clock::now());

    size_t size() const;

private:
    struct Slot {
        mutable std::mutex mutex;
        std::optional<Entry> entry;
    };

    std::shared_ptr<Slot> slot_for(const PeerId& id);
    std::shared_ptr<Slot> find_slot(const PeerId& id) const;

    std::unordered_map<PeerId, std::shared_ptr<Slot>> slots_;
    mutable std::shared_mutex slots_mutex_;
};

}
