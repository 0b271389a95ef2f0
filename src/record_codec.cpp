#include "record_codec.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include <boost/json.hpp>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace json = boost::json;

namespace namesys {

namespace {

const std::string SIGNATURE_TAG = "namesys-record:";

void append_u64(Bytes& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((v >> shift) & 0xff));
    }
}

void append_field(Bytes& out, const uint8_t* data, size_t size) {
    append_u64(out, size);
    out.insert(out.end(), data, data + size);
}

void append_field(Bytes& out, const Bytes& field) {
    append_field(out, field.data(), field.size());
}

const json::value& require(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw MalformedRecordError(std::string("Record is missing '") + key + "'");
    }
    return it->value();
}

uint64_t require_u64(const json::object& obj, const char* key) {
    const auto& v = require(obj, key);
    if (v.is_uint64()) return v.get_uint64();
    if (v.is_int64() && v.get_int64() >= 0) return static_cast<uint64_t>(v.get_int64());
    throw MalformedRecordError(std::string("Record field '") + key + "' is not an unsigned integer");
}

std::string require_string(const json::object& obj, const char* key) {
    const auto& v = require(obj, key);
    if (!v.is_string()) {
        throw MalformedRecordError(std::string("Record field '") + key + "' is not a string");
    }
    return std::string(v.get_string());
}

Bytes require_base64(const json::object& obj, const char* key) {
    auto decoded = encoding::base64_decode(require_string(obj, key));
    if (!decoded) {
        throw MalformedRecordError(std::string("Record field '") + key + "' is not base64");
    }
    return *decoded;
}

}

NameRecord RecordCodec::build(const Ed25519Key& key, const std::string& value, uint64_t sequence,
                              Clock::time_point validity, std::chrono::nanoseconds ttl) {
    NameRecord record;
    record.value = encoding::to_bytes(value);
    record.validity_type = ValidityType::EOL;
    record.validity = format_validity(validity);
    record.sequence = sequence;
    record.ttl = static_cast<uint64_t>(std::max<int64_t>(0, ttl.count()));
    record.public_key = key.public_bytes();
    record.signature = key.sign(canonical_bytes(record));
    return record;
}

// Length-prefixed concatenation so that no two field layouts share an encoding.
Bytes RecordCodec::canonical_bytes(const NameRecord& record) {
    Bytes out(SIGNATURE_TAG.begin(), SIGNATURE_TAG.end());
    append_field(out, record.value);

    Bytes type;
    append_u64(type, static_cast<uint64_t>(record.validity_type));
    append_field(out, type);

    append_field(out, reinterpret_cast<const uint8_t*>(record.validity.data()), record.validity.size());

    Bytes counters;
    append_u64(counters, record.sequence);
    append_u64(counters, record.ttl);
    append_field(out, counters);

    append_field(out, record.public_key);
    return out;
}

std::string RecordCodec::marshal(const NameRecord& record) {
    json::object obj;
    obj["value"] = encoding::base64_encode(record.value);
    obj["signature"] = encoding::base64_encode(record.signature);
    obj["validityType"] = static_cast<int64_t>(record.validity_type);
    obj["validity"] = record.validity;
    obj["sequence"] = record.sequence;
    obj["ttl"] = record.ttl;
    if (!record.public_key.empty()) {
        obj["pubKey"] = encoding::base64_encode(record.public_key);
    }
    return json::serialize(obj);
}

NameRecord RecordCodec::unmarshal(const std::string& bytes) {
    if (bytes.empty() || !InputValidator::is_within_size_limit(bytes.size(), MAX_RECORD_SIZE)) {
        throw MalformedRecordError("Record size out of bounds: " + std::to_string(bytes.size()));
    }

    json::value parsed;
    try {
        parsed = InputValidator::safe_parse_json(bytes);
    } catch (const std::exception& e) {
        throw MalformedRecordError(std::string("Record is not JSON: ") + e.what());
    }
    if (!parsed.is_object()) {
        throw MalformedRecordError("Record is not a JSON object");
    }
    const auto& obj = parsed.get_object();

    NameRecord record;
    record.value = require_base64(obj, "value");
    record.signature = require_base64(obj, "signature");

    uint64_t type = require_u64(obj, "validityType");
    if (type != static_cast<uint64_t>(ValidityType::EOL)) {
        throw MalformedRecordError("Unknown validity type " + std::to_string(type));
    }
    record.validity_type = ValidityType::EOL;

    record.validity = require_string(obj, "validity");
    if (!parse_validity(record.validity)) {
        throw MalformedRecordError("Unreadable validity '" + record.validity + "'");
    }
    record.sequence = require_u64(obj, "sequence");
    record.ttl = require_u64(obj, "ttl");
    if (obj.contains("pubKey")) {
        record.public_key = require_base64(obj, "pubKey");
    }
    return record;
}

void RecordCodec::validate(const NameRecord& record, const Bytes& public_key, Clock::time_point now) {
    if (!Ed25519Key::verify(public_key, canonical_bytes(record), record.signature)) {
        throw InvalidSignatureError("Record signature does not verify");
    }
    if (expires_at(record) <= now) {
        throw ExpiredRecordError("Record expired at " + record.validity);
    }
}

void RecordCodec::validate_for(const NameRecord& record, const PeerId& id, Clock::time_point now) {
    if (record.public_key.empty()) {
        throw InvalidSignatureError("Record carries no public key for " + id.to_string());
    }
    if (PeerId::from_public_key(record.public_key) != id) {
        throw InvalidSignatureError("Embedded public key does not belong to " + id.to_string());
    }
    validate(record, record.public_key, now);
}

std::string RecordCodec::format_validity(Clock::time_point tp) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
    auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto nanos = (since_epoch - secs).count();

    std::time_t t = static_cast<std::time_t>(secs.count());
    struct tm gmt;
    gmtime_r(&t, &gmt);

    std::stringstream ss;
    ss << std::put_time(&gmt, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setw(9) << std::setfill('0') << nanos << "Z";
    return ss.str();
}

std::optional<RecordCodec::Clock::time_point> RecordCodec::parse_validity(const std::string& text) {
    // YYYY-MM-DDTHH:MM:SS[.fraction]Z
    if (text.size() < 20 || text.size() > 30 || text.back() != 'Z') return std::nullopt;

    struct tm gmt = {};
    std::istringstream ss(text.substr(0, 19));
    ss >> std::get_time(&gmt, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return std::nullopt;

    int64_t nanos = 0;
    std::string rest = text.substr(19, text.size() - 20);
    if (!rest.empty()) {
        if (rest[0] != '.' || rest.size() < 2 || rest.size() > 10) return std::nullopt;
        std::string digits = rest.substr(1);
        if (!std::all_of(digits.begin(), digits.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            return std::nullopt;
        }
        digits.append(9 - digits.size(), '0');
        nanos = std::stoll(digits);
    }

    std::time_t secs = timegm(&gmt);
    if (secs == static_cast<std::time_t>(-1)) return std::nullopt;

    auto since_epoch = std::chrono::seconds(secs) + std::chrono::nanoseconds(nanos);
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(since_epoch));
}

RecordCodec::Clock::time_point RecordCodec::expires_at(const NameRecord& record) {
    auto tp = parse_validity(record.validity);
    if (!tp) {
        throw MalformedRecordError("Unreadable validity '" + record.validity + "'");
    }
    return *tp;
}

}
