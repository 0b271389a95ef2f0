#pragma once

#include <string>
#include <cstdint>

namespace namesys {

// Node configuration and resolution policy.
struct NameSysConfig {
    // --- Transport ---
    std::string redis_url = "tcp://127.0.0.1:6379?socket_timeout=100ms";
    int presence_ttl_sec = 30;          // Lifetime of a subscriber presence entry
    int presence_heartbeat_sec = 10;

    // --- Identity ---
    std::string self_key_name = "self";
    std::string private_key_hex = "";   // Empty generates a fresh node key

    // --- Resolution Policy ---
    // 0 means "subscribe and report not-found" instead of waiting.
    int default_resolve_timeout_ms = 0;
    int publish_resolve_timeout_ms = 1000;
    // How long a network-confirmed cache entry is served without a new wait.
    int cache_trust_sec = 3600;

    // --- Record Construction ---
    int64_t record_lifetime_sec = 24 * 60 * 60;
    int64_t record_ttl_sec = 60;

    // --- Maintenance ---
    int republish_initial_delay_sec = 60;
    int republish_interval_sec = 4 * 60 * 60;
    int cache_sweep_interval_sec = 300;

    // --- Delivery Confirmation (wait_for_remote_subscriber) ---
    int subscriber_retry_attempts = 5;
    int subscriber_retry_interval_ms = 2000;
};

// Applies NAMESYS_* environment variables on top of the given config.
// Throws ConfigError when a numeric variable does not parse.
void apply_env_overrides(NameSysConfig& config);

}
