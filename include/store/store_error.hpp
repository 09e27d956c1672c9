#ifndef HISTVAULT_STORE_ERROR_HPP
#define HISTVAULT_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace histvault::store {

// Local database or checkpoint persistence failure
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message)
        : std::runtime_error("Store error: " + message) {}
};

} // namespace histvault::store

#endif // HISTVAULT_STORE_ERROR_HPP
