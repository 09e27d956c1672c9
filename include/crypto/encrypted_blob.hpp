#ifndef HISTVAULT_CRYPTO_ENCRYPTED_BLOB_HPP
#define HISTVAULT_CRYPTO_ENCRYPTED_BLOB_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "history/history.hpp"

namespace histvault::crypto {

// Opaque form of a record as the server sees it. id, timestamp and
// hostname stay in the clear for ordering, dedup and host exclusion.
struct EncryptedBlob {
  std::string id;
  history::Timestamp timestamp{};
  std::string hostname;
  std::vector<uint8_t> nonce;
  std::vector<uint8_t> ciphertext;  // includes the trailing GCM tag
};

inline bool operator==(const EncryptedBlob& lhs, const EncryptedBlob& rhs) {
  return lhs.id == rhs.id && lhs.timestamp == rhs.timestamp && lhs.hostname == rhs.hostname
      && lhs.nonce == rhs.nonce && lhs.ciphertext == rhs.ciphertext;
}

} // namespace histvault::crypto

#endif // HISTVAULT_CRYPTO_ENCRYPTED_BLOB_HPP
