#include "ed25519_key.hpp"
#include "errors.hpp"
#include "input_validator.hpp"

namespace namesys {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

}

Ed25519Key::Ed25519Key(EVP_PKEY* pkey, bool has_private)
    : pkey_(pkey, PkeyDeleter{}), has_private_(has_private) {
    size_t len = PUBLIC_KEY_SIZE;
    public_bytes_.resize(len);
    if (EVP_PKEY_get_raw_public_key(pkey_.get(), public_bytes_.data(), &len) != 1 || len != PUBLIC_KEY_SIZE) {
        throw SigningError("Unable to export Ed25519 public key");
    }
}

Ed25519Key Ed25519Key::generate() {
    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        throw SigningError("Ed25519 keygen context unavailable");
    }
    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &pkey) != 1 || !pkey) {
        throw SigningError("CSPRNG failure during Ed25519 key generation");
    }
    return Ed25519Key(pkey, true);
}

Ed25519Key Ed25519Key::from_private_bytes(const Bytes& seed) {
    if (seed.size() != PRIVATE_KEY_SIZE) {
        throw SigningError("Ed25519 private key must be 32 bytes");
    }
    EVP_PKEY* pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size());
    if (!pkey) {
        throw SigningError("Rejected Ed25519 private key");
    }
    return Ed25519Key(pkey, true);
}

Ed25519Key Ed25519Key::from_private_hex(const std::string& hex) {
    if (!InputValidator::is_valid_hex(hex, PRIVATE_KEY_SIZE * 2)) {
        throw SigningError("Ed25519 private key must be 64 hex characters");
    }
    auto seed = encoding::from_hex(hex);
    if (!seed) {
        throw SigningError("Ed25519 private key must be 64 hex characters");
    }
    return from_private_bytes(*seed);
}

Ed25519Key Ed25519Key::from_public_bytes(const Bytes& public_key) {
    if (public_key.size() != PUBLIC_KEY_SIZE) {
        throw InvalidSignatureError("Ed25519 public key must be 32 bytes");
    }
    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size());
    if (!pkey) {
        throw InvalidSignatureError("Rejected Ed25519 public key");
    }
    return Ed25519Key(pkey, false);
}

Bytes Ed25519Key::private_bytes() const {
    if (!has_private_) {
        throw SigningError("Key has no private component");
    }
    Bytes out(PRIVATE_KEY_SIZE);
    size_t len = out.size();
    if (EVP_PKEY_get_raw_private_key(pkey_.get(), out.data(), &len) != 1) {
        throw SigningError("Unable to export Ed25519 private key");
    }
    return out;
}

Bytes Ed25519Key::sign(const Bytes& message) const {
    if (!has_private_) {
        throw SigningError("Key has no private component");
    }
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey_.get()) != 1) {
        throw SigningError("Ed25519 signing context unavailable");
    }
    Bytes signature(SIGNATURE_SIZE);
    size_t sig_len = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &sig_len, message.data(), message.size()) != 1) {
        throw SigningError("Ed25519 signing failed");
    }
    signature.resize(sig_len);
    return signature;
}

// Verifies an Ed25519 signature. Never throws; malformed keys simply fail.
bool Ed25519Key::verify(const Bytes& public_key, const Bytes& message, const Bytes& signature) {
    if (public_key.size() != PUBLIC_KEY_SIZE || signature.size() != SIGNATURE_SIZE) return false;

    EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, NULL, public_key.data(), public_key.size());
    if (!pkey) return false;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    bool result = false;

    if (ctx && EVP_DigestVerifyInit(ctx, NULL, NULL, NULL, pkey) == 1) {
        if (EVP_DigestVerify(ctx, signature.data(), signature.size(), message.data(), message.size()) == 1) {
            result = true;
        }
    }

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return result;
}

}
