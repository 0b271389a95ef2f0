#include "peer_id.hpp"
#include "errors.hpp"
#include <openssl/sha.h>

namespace namesys {

PeerId PeerId::from_public_key(const Bytes& public_key) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(public_key.data(), public_key.size(), hash);

    Bytes multihash{MULTIHASH_SHA2_256, DIGEST_LENGTH};
    multihash.insert(multihash.end(), hash, hash + SHA256_DIGEST_LENGTH);
    return PeerId(std::move(multihash));
}

PeerId PeerId::from_bytes(const Bytes& multihash) {
    if (multihash.size() != SIZE || multihash[0] != MULTIHASH_SHA2_256 || multihash[1] != DIGEST_LENGTH) {
        throw MalformedNameError("Not a sha2-256 multihash peer id");
    }
    return PeerId(multihash);
}

PeerId PeerId::parse(const std::string& name) {
    static const std::string ipns_prefix = "/ipns/";
    std::string text = name;
    if (text.rfind(ipns_prefix, 0) == 0) {
        text = text.substr(ipns_prefix.size());
    }
    if (text.empty() || text.size() > 64) {
        throw MalformedNameError("Invalid name: " + name);
    }
    auto decoded = encoding::base58_decode(text);
    if (!decoded) {
        throw MalformedNameError("Name is not base58btc: " + name);
    }
    return from_bytes(*decoded);
}

std::string PeerId::to_string() const {
    return encoding::base58_encode(bytes_);
}

}
