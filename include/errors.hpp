#pragma once

#include <stdexcept>
#include <string>

namespace namesys {

// Root of every failure raised by the name system.
class NameSysError : public std::runtime_error {
public:
    explicit NameSysError(const std::string& what) : std::runtime_error(what) {}
};

// Key missing or unusable. Always surfaced to the caller of publish.
class SigningError : public NameSysError {
public:
    explicit SigningError(const std::string& what) : NameSysError(what) {}
};

// Bytes could not be parsed as a name record.
class MalformedRecordError : public NameSysError {
public:
    explicit MalformedRecordError(const std::string& what) : NameSysError(what) {}
};

// Signature or embedded key does not match the name.
class InvalidSignatureError : public NameSysError {
public:
    explicit InvalidSignatureError(const std::string& what) : NameSysError(what) {}
};

class ExpiredRecordError : public NameSysError {
public:
    explicit ExpiredRecordError(const std::string& what) : NameSysError(what) {}
};

class ResolutionTimeoutError : public NameSysError {
public:
    explicit ResolutionTimeoutError(const std::string& what) : NameSysError(what) {}
};

class NoSubscriberFoundError : public NameSysError {
public:
    explicit NoSubscriberFoundError(const std::string& what) : NameSysError(what) {}
};

class NotFoundError : public NameSysError {
public:
    explicit NotFoundError(const std::string& what) : NameSysError(what) {}
};

class PublishError : public NameSysError {
public:
    explicit PublishError(const std::string& what) : NameSysError(what) {}
};

// Name is neither a peer id nor an /ipns/ path.
class MalformedNameError : public NameSysError {
public:
    explicit MalformedNameError(const std::string& what) : NameSysError(what) {}
};

class TransportError : public NameSysError {
public:
    explicit TransportError(const std::string& what) : NameSysError(what) {}
};

class ConfigError : public NameSysError {
public:
    explicit ConfigError(const std::string& what) : NameSysError(what) {}
};

}
