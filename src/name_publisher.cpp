#include "name_publisher.hpp"
#include "topic_deriver.hpp"
#include "input_validator.hpp"
#include "event_logger.hpp"
#include "metrics.hpp"
#include "errors.hpp"

namespace namesys {

NamePublisher::NamePublisher(const NameSysConfig& config, KeyStore& keys, NameCache& cache,
                             PubSubTransport& transport, NameResolver& resolver)
    : config_(config), keys_(keys), cache_(cache), transport_(transport), resolver_(resolver) {}

std::string NamePublisher::normalize_value(const std::string& value) {
    if (value.empty() || value[0] == '/') return value;
    return "/ipfs/" + value;
}

std::shared_ptr<std::mutex> NamePublisher::lock_for(const PeerId& id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& m = publish_locks_[id];
    if (!m) m = std::make_shared<std::mutex>();
    return m;
}

PublishResult NamePublisher::publish(const std::string& value, const PublishOptions& options) {
    std::string normalized = normalize_value(value);
    if (!InputValidator::is_valid_value_path(normalized)) {
        throw PublishError("Invalid value '" + EventLogger::sanitize_log_message(value) + "'");
    }

    Ed25519Key key = keys_.get(options.key);
    PeerId id = KeyStore::identifier_of(key.public_bytes());

    auto id_lock = lock_for(id);
    std::lock_guard<std::mutex> guard(*id_lock);

    if (options.resolve && !cache_.last_sequence(id)) {
        try {
            resolver_.await_network(id, std::chrono::milliseconds(config_.publish_resolve_timeout_ms));
        } catch (const NameSysError& e) {
            EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::TRANSPORT_ERROR,
                             id.to_string(), "Previous record lookup failed: " + std::string(e.what()));
        }
    }

    auto record = build_next(key, id, normalized,
                             options.lifetime.value_or(std::chrono::seconds(config_.record_lifetime_sec)),
                             options.ttl.value_or(std::chrono::seconds(config_.record_ttl_sec)));
    broadcast(id, record);

    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::RECORD_PUBLISHED,
                     id.to_string(), "key=" + options.key + " seq=" + std::to_string(record.sequence));
    return PublishResult{id.to_string(), normalized, record.sequence};
}

std::optional<PublishResult> NamePublisher::republish(const std::string& key_name) {
    Ed25519Key key = keys_.get(key_name);
    PeerId id = KeyStore::identifier_of(key.public_bytes());

    auto id_lock = lock_for(id);
    std::lock_guard<std::mutex> guard(*id_lock);

    auto entry = cache_.get(id);
    if (!entry) return std::nullopt;

    auto record = build_next(key, id, entry->record.value_string(),
                             std::chrono::seconds(config_.record_lifetime_sec),
                             std::chrono::seconds(config_.record_ttl_sec));
    broadcast(id, record);

    MetricsRegistry::instance().increment_counter("republished_total");
    EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::REPUBLISHED,
                     id.to_string(), "key=" + key_name + " seq=" + std::to_string(record.sequence));
    return PublishResult{id.to_string(), record.value_string(), record.sequence};
}

bool NamePublisher::initialize(const std::string& key_name, const std::string& value) {
    Ed25519Key key = keys_.get(key_name);
    PeerId id = KeyStore::identifier_of(key.public_bytes());

    auto id_lock = lock_for(id);
    std::lock_guard<std::mutex> guard(*id_lock);
    if (cache_.last_sequence(id)) return false;

    auto validity = RecordCodec::Clock::now() + std::chrono::seconds(config_.record_lifetime_sec);
    auto record = RecordCodec::build(key, normalize_value(value), 0, validity,
                                     std::chrono::seconds(config_.record_ttl_sec));
    return cache_.offer(id, record, NameCache::Origin::LOCAL) == NameCache::OfferResult::ADVANCED;
}

NameRecord NamePublisher::build_next(const Ed25519Key& key, const PeerId& id, const std::string& value,
                                     std::chrono::seconds lifetime, std::chrono::seconds ttl) {
    auto previous = cache_.last_sequence(id);
    uint64_t sequence = previous ? *previous + 1 : 0;
    auto validity = RecordCodec::Clock::now() + lifetime;
    return RecordCodec::build(key, value, sequence, validity, ttl);
}

// Hands the record to the transport, then makes it visible to local resolution.
void NamePublisher::broadcast(const PeerId& id, const NameRecord& record) {
    try {
        transport_.publish(TopicDeriver::derive_topic(id), RecordCodec::marshal(record));
    } catch (const TransportError& e) {
        EventLogger::log(EventLogger::Level::ERROR, EventLogger::EventType::TRANSPORT_ERROR,
                         id.to_string(), e.what());
        throw PublishError("Publish of " + id.to_string() + " failed: " + e.what());
    }
    if (cache_.offer(id, record, NameCache::Origin::LOCAL) != NameCache::OfferResult::ADVANCED) {
        EventLogger::log(EventLogger::Level::WARNING, EventLogger::EventType::RECORD_REJECTED,
                         id.to_string(), "Cache already holds seq >= " + std::to_string(record.sequence));
    }
    MetricsRegistry::instance().increment_counter("records_published_total");
}

}
