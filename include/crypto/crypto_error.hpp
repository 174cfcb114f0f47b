#ifndef PASTEALL_CRYPTO_ERROR_HPP
#define PASTEALL_CRYPTO_ERROR_HPP

#include <string>
#include "core/error.hpp"

namespace pasteall::crypto {

class CryptoError : public core::Error {
public:
    explicit CryptoError(const std::string& message)
        : core::Error(core::ErrorKind::Crypto, message) {}
};

class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError("Initialization error: " + message) {}
};

// No shared key has been derived for the device
class NoSharedKeyError : public CryptoError {
public:
    explicit NoSharedKeyError(const std::string& device_id)
        : CryptoError("No shared key for device: " + device_id) {}
};

// Ciphertext shorter than the nonce
class TooShortError : public CryptoError {
public:
    explicit TooShortError(const std::string& message)
        : CryptoError("Ciphertext too short: " + message) {}
};

class AuthenticationFailedError : public CryptoError {
public:
    explicit AuthenticationFailedError(const std::string& message)
        : CryptoError("Authentication failed: " + message) {}
};

// Malformed base64 or key of the wrong length
class InvalidKeyError : public CryptoError {
public:
    explicit InvalidKeyError(const std::string& message)
        : CryptoError("Invalid key: " + message) {}
};

class EncodingError : public CryptoError {
public:
    explicit EncodingError(const std::string& message)
        : CryptoError("Encoding error: " + message) {}
};

} // namespace pasteall::crypto

#endif // PASTEALL_CRYPTO_ERROR_HPP
