#ifndef HISTVAULT_CRYPTO_CIPHER_HPP
#define HISTVAULT_CRYPTO_CIPHER_HPP

#include <cstdint>
#include <vector>
#include "crypto/crypto_error.hpp"
#include "crypto/encrypted_blob.hpp"
#include "crypto/key.hpp"
#include "history/history.hpp"

namespace histvault::crypto {

/*
 * Authenticated record encryption with AES-256-GCM.
 *
 * The payload (see codec::RecordCodec) is the plaintext. The cleartext
 * metadata is bound in as associated data, so a blob whose id, timestamp
 * or hostname was altered fails to decrypt. A fresh random nonce is drawn
 * for every call to encrypt.
 */
class Cipher {
public:
  static constexpr size_t KEY_SIZE = SymmetricKey::KEY_SIZE;
  static constexpr size_t NONCE_SIZE = 12;   // 96 bits for GCM
  static constexpr size_t TAG_SIZE = 16;

  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Throws EncodingFailure if the record cannot be serialized or sealed
  static EncryptedBlob encrypt(const SymmetricKey& key, const history::HistoryRecord& record);
  // Throws AuthenticationFailure on any tampering or a wrong key,
  // codec::CodecError if the authenticated payload is not a valid record
  static history::HistoryRecord decrypt(const SymmetricKey& key, const EncryptedBlob& blob);

  // Generate a nonce
  static std::vector<uint8_t> generate_nonce();

private:
  // Raw AES-256-GCM; returns ciphertext || tag
  static std::vector<uint8_t> seal(const std::vector<uint8_t>& key, const std::vector<uint8_t>& nonce,
                                   const std::vector<uint8_t>& aad, const std::vector<uint8_t>& plaintext);
  // Returns false if the tag does not verify
  static bool open(const std::vector<uint8_t>& key, const std::vector<uint8_t>& nonce,
                   const std::vector<uint8_t>& aad, const std::vector<uint8_t>& sealed,
                   std::vector<uint8_t>& plaintext);
};

} // namespace histvault::crypto

#endif // HISTVAULT_CRYPTO_CIPHER_HPP
