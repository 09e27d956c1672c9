#ifndef HISTVAULT_API_TYPES_HPP
#define HISTVAULT_API_TYPES_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "api/api_error.hpp"
#include "crypto/encrypted_blob.hpp"
#include "history/history.hpp"

namespace histvault::api {

// ---- REQUEST AND RESPONSE BODIES ----
struct RegisterRequest {
  std::string username;
  std::string email;
  std::string password;
};

struct RegisterResponse {
  std::string session;
};

struct LoginRequest {
  std::string username;
  std::string password;
};

struct LoginResponse {
  std::string session;
};

struct UserResponse {
  std::string username;
};

// One encrypted blob as uploaded, and as served back by /sync/history
struct AddHistoryRequest {
  std::string id;
  history::Timestamp timestamp{};
  std::string data;
  std::string hostname;
  int64_t seq = 0;  // relay ingestion order; only set on served blobs
};

struct CountResponse {
  int64_t count = 0;
};

// sync_ts at the epoch asks the relay to pin the ingestion bound itself
struct SyncHistoryRequest {
  history::Timestamp sync_ts{};
  history::Timestamp history_ts{};
  std::string host;
  std::size_t page_size = 0;
  int64_t after_seq = 0;
};

struct SyncHistoryResponse {
  std::vector<AddHistoryRequest> history;
  history::Timestamp sync_ts{};  // ingestion bound the page was served under
};

struct ErrorResponse {
  std::string reason;
};


// ---- JSON CONVERSION ----
// from_json rejects missing or mistyped fields with ProtocolError
void to_json(nlohmann::json& j, const RegisterRequest& value);
void from_json(const nlohmann::json& j, RegisterRequest& value);
void to_json(nlohmann::json& j, const RegisterResponse& value);
void from_json(const nlohmann::json& j, RegisterResponse& value);
void to_json(nlohmann::json& j, const LoginRequest& value);
void from_json(const nlohmann::json& j, LoginRequest& value);
void to_json(nlohmann::json& j, const LoginResponse& value);
void from_json(const nlohmann::json& j, LoginResponse& value);
void to_json(nlohmann::json& j, const UserResponse& value);
void from_json(const nlohmann::json& j, UserResponse& value);
void to_json(nlohmann::json& j, const AddHistoryRequest& value);
void from_json(const nlohmann::json& j, AddHistoryRequest& value);
void to_json(nlohmann::json& j, const CountResponse& value);
void from_json(const nlohmann::json& j, CountResponse& value);
void to_json(nlohmann::json& j, const SyncHistoryResponse& value);
void from_json(const nlohmann::json& j, SyncHistoryResponse& value);
void to_json(nlohmann::json& j, const ErrorResponse& value);
void from_json(const nlohmann::json& j, ErrorResponse& value);

// Parses text and converts it, mapping every parse or schema failure to ProtocolError
template <typename T>
T parse_body(const std::string& text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& e) {
    throw ProtocolError(std::string("invalid JSON body: ") + e.what());
  }
  try {
    return j.get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ProtocolError(std::string("unexpected body shape: ") + e.what());
  }
}

template <typename T>
std::string dump_body(const T& value) {
  return nlohmann::json(value).dump();
}


// ---- QUERY PARAMETERS ----
using QueryParams = std::map<std::string, std::string>;

QueryParams to_query(const SyncHistoryRequest& request);
// Throws ProtocolError on a missing or malformed parameter
SyncHistoryRequest sync_request_from_query(const QueryParams& params);

// Percent-encoding for query strings
std::string url_encode(const std::string& value);
std::string url_decode(const std::string& value);
std::string build_query_string(const QueryParams& params);
QueryParams parse_query_string(const std::string& query);


// ---- BLOB MAPPING ----
// Packs nonce and ciphertext into the opaque data field
AddHistoryRequest to_wire(const crypto::EncryptedBlob& blob);
// Throws ProtocolError if data is not a well-formed nonce/ciphertext document
crypto::EncryptedBlob from_wire(const AddHistoryRequest& request);

} // namespace histvault::api

#endif // HISTVAULT_API_TYPES_HPP
