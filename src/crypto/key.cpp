#include "crypto/key.hpp"
#include "crypto/crypto_error.hpp"
#include "crypto/encoding.hpp"
#include <openssl/crypto.h>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace histvault::crypto {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SymmetricKey::SymmetricKey(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {
  if (bytes_.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Key: Invalid key size: " << bytes_.size()
                             << " bytes (expected " << KEY_SIZE << " bytes)";
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
    throw InitializationError("Invalid key size");
  }
}

SymmetricKey::~SymmetricKey() {
  if (!bytes_.empty()) {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
  }
}

//==============================================
// KEY MANAGEMENT
//==============================================

SymmetricKey generate_key() {
  BOOST_LOG_TRIVIAL(info) << "Key: Generating new symmetric key";
  return SymmetricKey(random_bytes(SymmetricKey::KEY_SIZE));
}

std::string encode_key(const SymmetricKey& key) {
  return base64_encode(key.bytes());
}

SymmetricKey decode_key(const std::string& text) {
  std::string trimmed = text;
  while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r' || trimmed.back() == ' ')) {
    trimmed.pop_back();
  }

  try {
    return SymmetricKey(base64_decode(trimmed));
  } catch (const InitializationError&) {
    throw;
  } catch (const CryptoError& e) {
    throw InitializationError(std::string("Key is not valid base64: ") + e.what());
  }
}

void save_key(const std::filesystem::path& path, const SymmetricKey& key) {
  BOOST_LOG_TRIVIAL(info) << "Key: Writing key file: " << path.string();

  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw InitializationError("Failed to create key file: " + path.string());
  }
  file << encode_key(key) << '\n';
  file.close();
  if (!file) {
    throw InitializationError("Failed to write key file: " + path.string());
  }

  std::error_code ec;
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Key: Failed to restrict key file permissions: " << ec.message();
  }
}

SymmetricKey load_key(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(debug) << "Key: Loading key file: " << path.string();

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Key: Key file not found: " << path.string();
    throw InitializationError("Key file not found: " + path.string());
  }

  std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  return decode_key(text);
}

SymmetricKey load_or_create_key(const std::filesystem::path& path) {
  if (std::filesystem::exists(path)) {
    return load_key(path);
  }
  SymmetricKey key = generate_key();
  save_key(path, key);
  return key;
}

} // namespace histvault::crypto
