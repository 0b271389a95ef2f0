#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>
#include "encoding.hpp"
#include "ed25519_key.hpp"
#include "peer_id.hpp"

namespace namesys {

enum class ValidityType : int64_t {
    EOL = 0   // Record is valid until the timestamp in `validity`
};

// Signed, versioned pointer published under an identity.
// Never mutated once built; a new publish produces a new record.
struct NameRecord {
    Bytes value;
    ValidityType validity_type = ValidityType::EOL;
    std::string validity;      // RFC 3339, UTC, nanosecond precision
    uint64_t sequence = 0;
    uint64_t ttl = 0;          // Nanoseconds
    Bytes public_key;
    Bytes signature;

    std::string value_string() const { return encoding::to_string(value); }

    bool operator==(const NameRecord& other) const = default;
};

// Builds, serializes and authenticates name records.
class RecordCodec {
public:
    using Clock = std::chrono::system_clock;

    static constexpr size_t MAX_RECORD_SIZE = 10 * 1024;

    /**
     * Constructs a record and signs it with the given key.
     * The public key is always embedded: peer ids are hashes and cannot yield it.
     * @throws SigningError if the key cannot sign.
     */
    static NameRecord build(const Ed25519Key& key, const std::string& value, uint64_t sequence,
                            Clock::time_point validity, std::chrono::nanoseconds ttl);

    static std::string marshal(const NameRecord& record);

    // Throws MalformedRecordError on structurally invalid input.
    static NameRecord unmarshal(const std::string& bytes);

    /**
     * Verifies the signature against `public_key`, then the validity bound.
     * @throws InvalidSignatureError, ExpiredRecordError
     */
    static void validate(const NameRecord& record, const Bytes& public_key,
                         Clock::time_point now = Clock::now());

    // Checks that the embedded key belongs to `id`, then calls validate().
    static void validate_for(const NameRecord& record, const PeerId& id,
                             Clock::time_point now = Clock::now());

    // Bytes covered by the signature: every field except the signature itself.
    static Bytes canonical_bytes(const NameRecord& record);

    static std::string format_validity(Clock::time_point tp);
    static std::optional<Clock::time_point> parse_validity(const std::string& text);

    // Throws MalformedRecordError if the validity string is unreadable.
    static Clock::time_point expires_at(const NameRecord& record);
};

}
