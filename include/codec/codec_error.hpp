#ifndef HISTVAULT_CODEC_ERROR_HPP
#define HISTVAULT_CODEC_ERROR_HPP

#include <stdexcept>
#include <string>

namespace histvault::codec {

class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& message)
        : std::runtime_error("Codec error: " + message) {}
};

} // namespace histvault::codec

#endif // HISTVAULT_CODEC_ERROR_HPP
