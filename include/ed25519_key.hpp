#pragma once

#include <memory>
#include <string>
#include <openssl/evp.h>
#include "encoding.hpp"

namespace namesys {

// Ed25519 key pair held in an OpenSSL EVP_PKEY.
// A key imported from public bytes only can verify but not sign.
class Ed25519Key {
public:
    static constexpr size_t PUBLIC_KEY_SIZE = 32;
    static constexpr size_t PRIVATE_KEY_SIZE = 32;
    static constexpr size_t SIGNATURE_SIZE = 64;

    // Draws a fresh key pair from the OpenSSL CSPRNG. Throws SigningError on failure.
    static Ed25519Key generate();

    // Imports a raw 32-byte private seed. Throws SigningError on bad input.
    static Ed25519Key from_private_bytes(const Bytes& seed);

    // Imports a seed given as 64 hex characters. Throws SigningError on bad input.
    static Ed25519Key from_private_hex(const std::string& hex);

    // Imports a raw 32-byte public key. Throws InvalidSignatureError on bad input.
    static Ed25519Key from_public_bytes(const Bytes& public_key);

    bool has_private() const { return has_private_; }
    const Bytes& public_bytes() const { return public_bytes_; }
    Bytes private_bytes() const;

    // Throws SigningError if the key has no private half.
    Bytes sign(const Bytes& message) const;

    static bool verify(const Bytes& public_key, const Bytes& message, const Bytes& signature);

private:
    struct PkeyDeleter {
        void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
    };

    Ed25519Key(EVP_PKEY* pkey, bool has_private);

    std::shared_ptr<EVP_PKEY> pkey_;
    bool has_private_ = false;
    Bytes public_bytes_;
};

}
