#ifndef HISTVAULT_CRYPTO_ERROR_HPP
#define HISTVAULT_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>
#include "history/history.hpp"

namespace histvault::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class InitializationError : public CryptoError {
public:
    explicit InitializationError(const std::string& message)
        : CryptoError("Initialization error: " + message) {}
};

class EncodingFailure : public CryptoError {
public:
    explicit EncodingFailure(const std::string& message)
        : CryptoError("Encoding failure: " + message) {}
};

// Ciphertext, nonce, metadata and key did not verify
class AuthenticationFailure : public CryptoError {
public:
    AuthenticationFailure(const std::string& id, history::Timestamp timestamp, const std::string& hostname)
        : CryptoError("Authentication failure: blob " + id + " (" + history::to_rfc3339(timestamp)
                      + ", host " + hostname + ") did not verify")
        , id_(id)
        , timestamp_(timestamp)
        , hostname_(hostname) {}

    const std::string& id() const { return id_; }
    history::Timestamp timestamp() const { return timestamp_; }
    const std::string& hostname() const { return hostname_; }

private:
    std::string id_;
    history::Timestamp timestamp_;
    std::string hostname_;
};

} // namespace histvault::crypto

#endif // HISTVAULT_CRYPTO_ERROR_HPP
