#include "name_cache.hpp"

namespace namesys {

std::shared_ptr<NameCache::Slot> NameCache::find_slot(const PeerId& id) const {
    std::shared_lock lock(slots_mutex_);
    auto it = slots_.find(id);
    return it != slots_.end() ? it->second : nullptr;
}

std::shared_ptr<NameCache::Slot> NameCache::slot_for(const PeerId& id) {
    if (auto slot = find_slot(id)) return slot;

    std::unique_lock lock(slots_mutex_);
    auto& slot = slots_[id];
    if (!slot) slot = std::make_shared<Slot>();
    return slot;
}

// Compare-and-swap under the identity's own lock.
NameCache::OfferResult NameCache::offer(const PeerId& id, const NameRecord& record, Origin origin,
                                        Clock::time_point now) {
    Clock::time_point expires = RecordCodec::expires_at(record);
    if (expires <= now) return OfferResult::IGNORED;

    auto slot = slot_for(id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->entry && slot->entry->expires_at > now &&
        record.sequence <= slot->entry->record.sequence) {
        if (record == slot->entry->record) {
            slot->entry->confirmed_at = now;
            return OfferResult::CONFIRMED;
        }
        return OfferResult::IGNORED;
    }
    slot->entry = Entry{record, now, now, expires, origin};
    return OfferResult::ADVANCED;
}

std::optional<NameCache::Entry> NameCache::get(const PeerId& id, Clock::time_point now) const {
    auto slot = find_slot(id);
    if (!slot) return std::nullopt;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->entry || slot->entry->expires_at <= now) return std::nullopt;
    return slot->entry;
}

std::optional<uint64_t> NameCache::last_sequence(const PeerId& id) const {
    auto slot = find_slot(id);
    if (!slot) return std::nullopt;

    std::lock_guard<std::mutex> lock(slot->mutex);
    if (!slot->entry) return std::nullopt;
    return slot->entry->record.sequence;
}

size_t NameCache::evict_expired(Clock::time_point now) {
    std::unique_lock lock(slots_mutex_);
    size_t removed = 0;
    for (auto it = slots_.begin(); it != slots_.end(); ) {
        // A slot still referenced elsewhere has an offer in flight
        if (it->second.use_count() > 1) {
            ++it;
            continue;
        }
        bool expired = false;
        {
            std::lock_guard<std::mutex> slot_lock(it->second->mutex);
            expired = !it->second->entry || it->second->entry->expires_at <= now;
        }
        if (expired) {
            it = slots_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t NameCache::size() const {
    std::shared_lock lock(slots_mutex_);
    return slots_.size();
}

}
