#pragma once

#include <string>
#include <functional>
#include "encoding.hpp"

namespace namesys {

// Peer identifier: sha2-256 multihash of the raw Ed25519 public key.
// Text form is base58btc ("Qm...").
class PeerId {
public:
    static constexpr uint8_t MULTIHASH_SHA2_256 = 0x12;
    static constexpr uint8_t DIGEST_LENGTH = 0x20;
    static constexpr size_t SIZE = 34;

    PeerId() = default;

    static PeerId from_public_key(const Bytes& public_key);

    // Accepts "Qm..." or "/ipns/Qm...". Throws MalformedNameError.
    static PeerId parse(const std::string& name);

    // Accepts the 34 raw multihash bytes. Throws MalformedNameError.
    static PeerId from_bytes(const Bytes& multihash);

    const Bytes& bytes() const { return bytes_; }
    std::string to_string() const;
    bool empty() const { return bytes_.empty(); }

    bool operator==(const PeerId& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const PeerId& other) const { return !(*this == other); }

private:
    explicit PeerId(Bytes bytes) : bytes_(std::move(bytes)) {}

    Bytes bytes_;
};

}

namespace std {
template <>
struct hash<namesys::PeerId> {
    size_t operator()(const namesys::PeerId& id) const {
        return hash<string>{}(string(id.bytes().begin(), id.bytes().end()));
    }
};
}
