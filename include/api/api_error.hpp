#ifndef HISTVAULT_API_ERROR_HPP
#define HISTVAULT_API_ERROR_HPP

#include <stdexcept>
#include <string>

namespace histvault::api {

// Request did not complete or the server answered with a non-2xx status
class TransportError : public std::runtime_error {
public:
    enum class Kind {
        Timeout,
        ConnectionRefused,
        Network,
        Status
    };

    TransportError(Kind kind, const std::string& message, unsigned status = 0, const std::string& reason = "")
        : std::runtime_error("Transport error: " + message)
        , kind_(kind)
        , status_(status)
        , reason_(reason) {}

    Kind kind() const { return kind_; }
    // HTTP status, 0 unless kind() is Status
    unsigned status() const { return status_; }
    // Server supplied reason, if any
    const std::string& reason() const { return reason_; }

private:
    Kind kind_;
    unsigned status_;
    std::string reason_;
};

// Malformed request or response body, or a response that breaks the protocol
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message)
        : std::runtime_error("Protocol error: " + message) {}
};

} // namespace histvault::api

#endif // HISTVAULT_API_ERROR_HPP
