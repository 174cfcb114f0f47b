#ifndef PASTEALL_CORE_ERROR_HPP
#define PASTEALL_CORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pasteall::core {

enum class ErrorKind {
    Crypto,
    Network,
    Pairing,
    Discovery,
    Transfer,
    Io,
    Serialization,
    InvalidArgument,
    Storage,
    Configuration
};

inline const char* kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Crypto:          return "crypto";
        case ErrorKind::Network:         return "network";
        case ErrorKind::Pairing:         return "pairing";
        case ErrorKind::Discovery:       return "discovery";
        case ErrorKind::Transfer:        return "transfer";
        case ErrorKind::Io:              return "io";
        case ErrorKind::Serialization:   return "serialization";
        case ErrorKind::InvalidArgument: return "invalid argument";
        case ErrorKind::Storage:         return "storage";
        case ErrorKind::Configuration:   return "configuration";
    }
    return "unknown";
}

// Base of every error raised by the library
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(kind_to_string(kind)) + " error: " + message)
        , kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class NetworkError : public Error {
public:
    explicit NetworkError(const std::string& message)
        : Error(ErrorKind::Network, message) {}
};

class PairingError : public Error {
public:
    explicit PairingError(const std::string& message)
        : Error(ErrorKind::Pairing, message) {}
};

class DiscoveryError : public Error {
public:
    explicit DiscoveryError(const std::string& message)
        : Error(ErrorKind::Discovery, message) {}
};

class TransferError : public Error {
public:
    explicit TransferError(const std::string& message)
        : Error(ErrorKind::Transfer, message) {}
};

class IoError : public Error {
public:
    explicit IoError(const std::string& message)
        : Error(ErrorKind::Io, message) {}
};

class SerializationError : public Error {
public:
    explicit SerializationError(const std::string& message)
        : Error(ErrorKind::Serialization, message) {}
};

class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(ErrorKind::InvalidArgument, message) {}
};

class StorageError : public Error {
public:
    explicit StorageError(const std::string& message)
        : Error(ErrorKind::Storage, message) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(ErrorKind::Configuration, message) {}
};

} // namespace pasteall::core

#endif // PASTEALL_CORE_ERROR_HPP
