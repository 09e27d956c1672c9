#ifndef HISTVAULT_CRYPTO_ENCODING_HPP
#define HISTVAULT_CRYPTO_ENCODING_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace histvault::crypto {

// Standard padded base64 via OpenSSL EVP
std::string base64_encode(const std::vector<uint8_t>& data);
// Throws CryptoError on malformed input
std::vector<uint8_t> base64_decode(const std::string& text);

std::string hex_encode(const uint8_t* data, std::size_t size);

// Fills a buffer from the OpenSSL CSPRNG
std::vector<uint8_t> random_bytes(std::size_t size);

} // namespace histvault::crypto

#endif // HISTVAULT_CRYPTO_ENCODING_HPP
