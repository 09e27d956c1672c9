#ifndef HISTVAULT_SERVER_API_ERROR_HPP
#define HISTVAULT_SERVER_API_ERROR_HPP

#include <stdexcept>
#include <string>

namespace histvault::server {

// Request refused with an HTTP status; rendered as {"reason": ...}
class ApiError : public std::runtime_error {
public:
    ApiError(unsigned status, const std::string& reason)
        : std::runtime_error(reason)
        , status_(status) {}

    unsigned status() const { return status_; }

private:
    unsigned status_;
};

} // namespace histvault::server

#endif // HISTVAULT_SERVER_API_ERROR_HPP
