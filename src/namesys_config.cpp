#include "namesys_config.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <limits>
#include <string>

namespace namesys {

namespace {

// Validity is carried in nanoseconds since the epoch; keep now + lifetime in range.
constexpr long long MAX_RECORD_LIFETIME_SEC = 100LL * 365 * 24 * 60 * 60;

long long parse_env_number(const char* name, const char* raw,
                           long long max = std::numeric_limits<int>::max()) {
    try {
        size_t pos = 0;
        long long value = std::stoll(raw, &pos);
        if (pos != std::string(raw).size() || value < 0 || value > max) {
            throw ConfigError(std::string("Invalid value for ") + name + ": " + raw);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("Invalid value for ") + name + ": " + raw);
    }
}

}

void apply_env_overrides(NameSysConfig& config) {
    if (const char* e = std::getenv("NAMESYS_REDIS_URL")) {
        config.redis_url = e;
    }
    if (const char* e = std::getenv("NAMESYS_PRIVATE_KEY")) {
        config.private_key_hex = e;
    }
    if (const char* e = std::getenv("NAMESYS_RESOLVE_TIMEOUT_MS")) {
        config.default_resolve_timeout_ms = static_cast<int>(parse_env_number("NAMESYS_RESOLVE_TIMEOUT_MS", e));
    }
    if (const char* e = std::getenv("NAMESYS_CACHE_TRUST_SEC")) {
        config.cache_trust_sec = static_cast<int>(parse_env_number("NAMESYS_CACHE_TRUST_SEC", e));
    }
    if (const char* e = std::getenv("NAMESYS_RECORD_LIFETIME_SEC")) {
        config.record_lifetime_sec = parse_env_number("NAMESYS_RECORD_LIFETIME_SEC", e, MAX_RECORD_LIFETIME_SEC);
    }
    if (const char* e = std::getenv("NAMESYS_REPUBLISH_INTERVAL_SEC")) {
        config.republish_interval_sec = static_cast<int>(parse_env_number("NAMESYS_REPUBLISH_INTERVAL_SEC", e));
    }
}

}
