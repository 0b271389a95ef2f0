#pragma once

#include <string>
#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include "ed25519_key.hpp"
#include "peer_id.hpp"

namespace namesys {

struct KeyInfo {
    std::string name;
    PeerId id;
};

// Identity service: named signing keys controlled by this node.
// The default key is conventionally named "self".
class KeyStore {
public:
    virtual ~KeyStore() = default;
    
    /**
     * Returns the named key.
     * @throws SigningError if no key with that name exists.
     */
    virtual Ed25519Key get(const std::string& name) const = 0;

    /**
     * Looks up the key whose public half yields the given peer id.
     * @return Key name, or nullopt when this node does not control the id.
     */
    virtual std::optional<std::string> find(const PeerId& id) const = 0;

    // Generates and stores a fresh key. Throws SigningError if the name is taken.
    virtual KeyInfo generate(const std::string& name) = 0;

    // Stores an existing key under a name, replacing any previous entry.
    virtual KeyInfo import(const std::string& name, const Ed25519Key& key) = 0;

    virtual std::vector<KeyInfo> list() const = 0;

    Bytes sign(const std::string& name, const Bytes& message) const {
        return get(name).sign(message);
    }

    Bytes public_key_of(const std::string& name) const {
        return get(name).public_bytes();
    }

    static PeerId identifier_of(const Bytes& public_key) {
        return PeerId::from_public_key(public_key);
    }
};

// In-process key store.
class MemoryKeyStore : public KeyStore {
public:
    MemoryKeyStore() = default;

    Ed25519Key get(const std::string& name) const override;
    std::optional<std::string> find(const PeerId& id) const override;
    KeyInfo generate(const std::string& name) override;
    KeyInfo import(const std::string& name, const Ed25519Key& key) override;
    std::vector<KeyInfo> list() const override;

private:
    struct Entry {
        Ed25519Key key;
        PeerId id;
    };

    std::map<std::string, Entry> keys_;
    mutable std::mutex mutex_;
};

}
