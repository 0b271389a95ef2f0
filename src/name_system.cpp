#include "name_system.hpp"
#include "topic_deriver.hpp"
#include "event_logger.hpp"

namespace namesys {

NameSystem::NameSystem(const NameSysConfig& config, PubSubTransport& transport, KeyStore& keys)
    : config_(config)
    , transport_(transport)
    , keys_(keys)
    , tracker_(transport_)
    , resolver_(config_, keys_, cache_, tracker_)
    , publisher_(config_, keys_, cache_, transport_, resolver_) {}

// The resolver's listeners capture it; close every topic while it is still alive.
NameSystem::~NameSystem() {
    tracker_.cancel_all();
}

void NameSystem::initialize_keyspace() {
    if (publisher_.initialize(config_.self_key_name, EMPTY_DIRECTORY_PATH)) {
        EventLogger::log(EventLogger::Level::INFO, EventLogger::EventType::LIFECYCLE,
                         self_id().to_string(), "Keyspace initialized");
    }
}

PublishResult NameSystem::publish(const std::string& value, const PublishOptions& options) {
    return publisher_.publish(value, options);
}

std::string NameSystem::resolve(const std::string& name, const ResolveOptions& options) {
    return resolver_.resolve(name, options);
}

void NameSystem::watch(const std::string& name) {
    resolver_.watch(PeerId::parse(name));
}

std::vector<std::string> NameSystem::subscriptions() const {
    std::vector<std::string> names;
    for (const auto& topic : tracker_.topics()) {
        if (auto id = TopicDeriver::peer_of_topic(topic)) {
            names.push_back("/ipns/" + id->to_string());
        }
    }
    return names;
}

bool NameSystem::cancel(const std::string& name) {
    PeerId id = PeerId::parse(name);
    resolver_.forget(id);
    return tracker_.cancel(TopicDeriver::derive_topic(id));
}

std::vector<std::string> NameSystem::wait_for_subscriber(const std::string& name, const std::string& peer_hint,
                                                         std::optional<RetryPolicy> policy) {
    RetryPolicy effective = policy.value_or(RetryPolicy{
        config_.subscriber_retry_attempts,
        std::chrono::milliseconds(config_.subscriber_retry_interval_ms)});
    return tracker_.wait_for_remote_subscriber(topic_for(name), peer_hint, effective);
}

std::string NameSystem::topic_for(const std::string& name) {
    return TopicDeriver::derive_topic(PeerId::parse(name));
}

PeerId NameSystem::self_id() const {
    return KeyStore::identifier_of(keys_.public_key_of(config_.self_key_name));
}

}
