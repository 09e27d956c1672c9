#include "crypto/cipher.hpp"
#include "crypto/encoding.hpp"
#include "codec/record_codec.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <limits>

namespace histvault::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("Cipher: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  EVP_CIPHER_CTX* get() { return ctx; }
};

namespace {

int checked_length(std::size_t size) {
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw EncodingFailure("Cipher: Input too large");
  }
  return static_cast<int>(size);
}

} // namespace

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

EncryptedBlob Cipher::encrypt(const SymmetricKey& key, const history::HistoryRecord& record) {
  BOOST_LOG_TRIVIAL(trace) << "Cipher: Encrypting record " << record.id;

  std::vector<uint8_t> payload;
  std::vector<uint8_t> aad;
  try {
    payload = codec::RecordCodec::encode_payload(record);
    aad = codec::RecordCodec::encode_metadata(record.id, record.timestamp, record.hostname);
  } catch (const codec::CodecError& e) {
    throw EncodingFailure(std::string("record ") + record.id + ": " + e.what());
  }

  EncryptedBlob blob;
  blob.id = record.id;
  blob.timestamp = record.timestamp;
  blob.hostname = record.hostname;
  blob.nonce = generate_nonce();
  blob.ciphertext = seal(key.bytes(), blob.nonce, aad, payload);
  return blob;
}

history::HistoryRecord Cipher::decrypt(const SymmetricKey& key, const EncryptedBlob& blob) {
  BOOST_LOG_TRIVIAL(trace) << "Cipher: Decrypting blob " << blob.id;

  if (blob.nonce.size() != NONCE_SIZE || blob.ciphertext.size() < TAG_SIZE) {
    BOOST_LOG_TRIVIAL(warning) << "Cipher: Blob " << blob.id << " has a malformed nonce or ciphertext";
    throw AuthenticationFailure(blob.id, blob.timestamp, blob.hostname);
  }

  const auto aad = codec::RecordCodec::encode_metadata(blob.id, blob.timestamp, blob.hostname);
  std::vector<uint8_t> payload;
  if (!open(key.bytes(), blob.nonce, aad, blob.ciphertext, payload)) {
    BOOST_LOG_TRIVIAL(warning) << "Cipher: Blob " << blob.id << " failed authentication";
    throw AuthenticationFailure(blob.id, blob.timestamp, blob.hostname);
  }

  history::HistoryRecord record;
  record.id = blob.id;
  record.timestamp = blob.timestamp;
  record.hostname = blob.hostname;
  codec::RecordCodec::decode_payload(payload, record);
  return record;
}

std::vector<uint8_t> Cipher::generate_nonce() {
  return random_bytes(NONCE_SIZE);
}

//==============================================
// AES-256-GCM
//==============================================

std::vector<uint8_t> Cipher::seal(const std::vector<uint8_t>& key, const std::vector<uint8_t>& nonce,
                                  const std::vector<uint8_t>& aad, const std::vector<uint8_t>& plaintext) {
  if (key.size() != KEY_SIZE) {
    throw InitializationError("Invalid key size");
  }

  CipherContext context;
  if (!EVP_EncryptInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr)
      || !EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr)
      || !EVP_EncryptInit_ex(context.get(), nullptr, nullptr, key.data(), nonce.data())) {
    throw EncodingFailure("Cipher: Failed to initialize encryption context");
  }

  int outlen = 0;
  if (!aad.empty()
      && !EVP_EncryptUpdate(context.get(), nullptr, &outlen, aad.data(), checked_length(aad.size()))) {
    throw EncodingFailure("Cipher: Failed to process associated data");
  }

  std::vector<uint8_t> output(plaintext.size() + TAG_SIZE);
  int total = 0;
  if (!plaintext.empty()) {
    if (!EVP_EncryptUpdate(context.get(), output.data(), &outlen,
                           plaintext.data(), checked_length(plaintext.size()))) {
      throw EncodingFailure("Cipher: Failed to encrypt payload");
    }
    total = outlen;
  }

  if (!EVP_EncryptFinal_ex(context.get(), output.data() + total, &outlen)) {
    throw EncodingFailure("Cipher: Failed to finalize encryption");
  }
  total += outlen;

  if (!EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE),
                           output.data() + total)) {
    throw EncodingFailure("Cipher: Failed to read authentication tag");
  }

  output.resize(static_cast<std::size_t>(total) + TAG_SIZE);
  return output;
}

bool Cipher::open(const std::vector<uint8_t>& key, const std::vector<uint8_t>& nonce,
                  const std::vector<uint8_t>& aad, const std::vector<uint8_t>& sealed,
                  std::vector<uint8_t>& plaintext) {
  if (key.size() != KEY_SIZE) {
    throw InitializationError("Invalid key size");
  }

  const std::size_t body_size = sealed.size() - TAG_SIZE;
  std::vector<uint8_t> tag(sealed.begin() + static_cast<std::ptrdiff_t>(body_size), sealed.end());

  CipherContext context;
  if (!EVP_DecryptInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr)
      || !EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr)
      || !EVP_DecryptInit_ex(context.get(), nullptr, nullptr, key.data(), nonce.data())) {
    throw CryptoError("Cipher: Failed to initialize decryption context");
  }

  int outlen = 0;
  if (!aad.empty()
      && !EVP_DecryptUpdate(context.get(), nullptr, &outlen, aad.data(), checked_length(aad.size()))) {
    return false;
  }

  plaintext.assign(body_size, 0);
  int total = 0;
  if (body_size > 0) {
    if (!EVP_DecryptUpdate(context.get(), plaintext.data(), &outlen,
                           sealed.data(), checked_length(body_size))) {
      return false;
    }
    total = outlen;
  }

  if (!EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data())) {
    return false;
  }

  // A zero return from the final call means the tag did not match
  if (EVP_DecryptFinal_ex(context.get(), plaintext.data() + total, &outlen) <= 0) {
    plaintext.clear();
    return false;
  }
  plaintext.resize(static_cast<std::size_t>(total + outlen));
  return true;
}

} // namespace histvault::crypto
