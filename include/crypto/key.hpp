#ifndef HISTVAULT_CRYPTO_KEY_HPP
#define HISTVAULT_CRYPTO_KEY_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace histvault::crypto {

// Per-user 256-bit key shared by every record of that user
class SymmetricKey {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws InitializationError unless bytes holds exactly KEY_SIZE bytes
  explicit SymmetricKey(std::vector<uint8_t> bytes);
  SymmetricKey(const SymmetricKey&) = default;
  SymmetricKey(SymmetricKey&&) = default;
  SymmetricKey& operator=(const SymmetricKey&) = default;
  SymmetricKey& operator=(SymmetricKey&&) = default;
  // Wipes key material
  ~SymmetricKey();

  const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
  std::vector<uint8_t> bytes_;
};


// ---- KEY MANAGEMENT ----
SymmetricKey generate_key();
std::string encode_key(const SymmetricKey& key);
// Throws InitializationError on malformed text or wrong length
SymmetricKey decode_key(const std::string& text);

// Key files hold the base64 form followed by a newline
void save_key(const std::filesystem::path& path, const SymmetricKey& key);
SymmetricKey load_key(const std::filesystem::path& path);
SymmetricKey load_or_create_key(const std::filesystem::path& path);

} // namespace histvault::crypto

#endif // HISTVAULT_CRYPTO_KEY_HPP
