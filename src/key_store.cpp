#include "key_store.hpp"
#include "errors.hpp"
#include "input_validator.hpp"

namespace namesys {

Ed25519Key MemoryKeyStore::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = keys_.find(name);
    if (it == keys_.end()) {
        throw SigningError("No key named '" + name + "'");
    }
    return it->second.key;
}

std::optional<std::string> MemoryKeyStore::find(const PeerId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, entry] : keys_) {
        if (entry.id == id) return name;
    }
    return std::nullopt;
}

KeyInfo MemoryKeyStore::generate(const std::string& name) {
    if (!InputValidator::is_valid_key_name(name)) {
        throw SigningError("Invalid key name '" + name + "'");
    }
    auto key = Ed25519Key::generate();
    PeerId id = identifier_of(key.public_bytes());

    std::lock_guard<std::mutex> lock(mutex_);
    if (keys_.count(name)) {
        throw SigningError("Key '" + name + "' already exists");
    }
    keys_.emplace(name, Entry{key, id});
    return KeyInfo{name, id};
}

KeyInfo MemoryKeyStore::import(const std::string& name, const Ed25519Key& key) {
    if (!InputValidator::is_valid_key_name(name)) {
        throw SigningError("Invalid key name '" + name + "'");
    }
    if (!key.has_private()) {
        throw SigningError("Cannot import a verify-only key as '" + name + "'");
    }
    PeerId id = identifier_of(key.public_bytes());

    std::lock_guard<std::mutex> lock(mutex_);
    keys_.insert_or_assign(name, Entry{key, id});
    return KeyInfo{name, id};
}

std::vector<KeyInfo> MemoryKeyStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<KeyInfo> out;
    out.reserve(keys_.size());
    for (const auto& [name, entry] : keys_) {
        out.push_back(KeyInfo{name, entry.id});
    }
    return out;
}

}
