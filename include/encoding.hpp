#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace namesys {

using Bytes = std::vector<uint8_t>;

// Text encodings shared by peer ids, topics and the record wire format.
namespace encoding {

std::string to_hex(const uint8_t* data, size_t size);
inline std::string to_hex(const Bytes& data) { return to_hex(data.data(), data.size()); }
std::optional<Bytes> from_hex(const std::string& hex);

// Bitcoin alphabet, leading zero bytes map to '1'.
std::string base58_encode(const Bytes& data);
std::optional<Bytes> base58_decode(const std::string& text);

// Standard alphabet with '=' padding.
std::string base64_encode(const Bytes& data);
std::optional<Bytes> base64_decode(const std::string& text);

// URL-safe alphabet ('-', '_') without padding.
std::string base64url_encode(const Bytes& data);

inline Bytes to_bytes(const std::string& s) { return Bytes(s.begin(), s.end()); }
inline std::string to_string(const Bytes& b) { return std::string(b.begin(), b.end()); }

}

}
