#include "crypto/encoding.hpp"
#include "crypto/crypto_error.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <limits>
#include <sstream>

namespace histvault::crypto {

//==============================================
// BASE64
//==============================================

std::string base64_encode(const std::vector<uint8_t>& data) {
  if (data.empty()) {
    return {};
  }
  if (data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() / 2)) {
    throw CryptoError("Crypto encoding: Input too large for base64");
  }

  std::string output(4 * ((data.size() + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                                      data.data(), static_cast<int>(data.size()));
  output.resize(static_cast<std::size_t>(written));
  return output;
}

std::vector<uint8_t> base64_decode(const std::string& text) {
  if (text.empty()) {
    return {};
  }
  if (text.size() % 4 != 0 || text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    BOOST_LOG_TRIVIAL(debug) << "Crypto encoding: Rejecting base64 input of length " << text.size();
    throw CryptoError("Crypto encoding: Malformed base64 input");
  }

  std::vector<uint8_t> output(3 * (text.size() / 4));
  const int written = EVP_DecodeBlock(output.data(),
                                      reinterpret_cast<const unsigned char*>(text.data()),
                                      static_cast<int>(text.size()));
  if (written < 0) {
    throw CryptoError("Crypto encoding: Malformed base64 input");
  }

  // EVP_DecodeBlock keeps the bytes produced by '=' padding
  std::size_t padding = 0;
  if (text[text.size() - 1] == '=') ++padding;
  if (text[text.size() - 2] == '=') ++padding;
  output.resize(static_cast<std::size_t>(written) - padding);
  return output;
}

//==============================================
// HEX AND RANDOMNESS
//==============================================

std::string hex_encode(const uint8_t* data, std::size_t size) {
  std::stringstream ss;
  for (std::size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return ss.str();
}

std::vector<uint8_t> random_bytes(std::size_t size) {
  std::vector<uint8_t> buffer(size);
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())
      || RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Crypto encoding: Failed to generate " << size << " random bytes";
    throw CryptoError("Crypto encoding: Failed to generate random bytes");
  }
  return buffer;
}

} // namespace histvault::crypto
