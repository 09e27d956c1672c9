#include "api/api_types.hpp"
#include "codec/codec_error.hpp"
#include "crypto/crypto_error.hpp"
#include "crypto/encoding.hpp"
#include <boost/log/trivial.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace histvault::api {

namespace {

const nlohmann::json& require_field(const nlohmann::json& j, const char* key) {
  if (!j.is_object()) {
    throw ProtocolError("expected a JSON object");
  }
  auto it = j.find(key);
  if (it == j.end()) {
    throw ProtocolError(std::string("missing field '") + key + "'");
  }
  return *it;
}

std::string require_string(const nlohmann::json& j, const char* key) {
  const auto& field = require_field(j, key);
  if (!field.is_string()) {
    throw ProtocolError(std::string("field '") + key + "' must be a string");
  }
  return field.get<std::string>();
}

int64_t require_int64(const nlohmann::json& j, const char* key) {
  const auto& field = require_field(j, key);
  if (!field.is_number_integer()) {
    throw ProtocolError(std::string("field '") + key + "' must be an integer");
  }
  return field.get<int64_t>();
}

history::Timestamp parse_timestamp(const std::string& text, const char* key) {
  try {
    return history::from_rfc3339(text);
  } catch (const codec::CodecError& e) {
    throw ProtocolError(std::string("field '") + key + "': " + e.what());
  }
}

} // namespace

//==============================================
// JSON CONVERSION
//==============================================

void to_json(nlohmann::json& j, const RegisterRequest& value) {
  j = nlohmann::json{{"username", value.username}, {"email", value.email}, {"password", value.password}};
}

void from_json(const nlohmann::json& j, RegisterRequest& value) {
  value.username = require_string(j, "username");
  value.email = require_string(j, "email");
  value.password = require_string(j, "password");
}

void to_json(nlohmann::json& j, const RegisterResponse& value) {
  j = nlohmann::json{{"session", value.session}};
}

void from_json(const nlohmann::json& j, RegisterResponse& value) {
  value.session = require_string(j, "session");
}

void to_json(nlohmann::json& j, const LoginRequest& value) {
  j = nlohmann::json{{"username", value.username}, {"password", value.password}};
}

void from_json(const nlohmann::json& j, LoginRequest& value) {
  value.username = require_string(j, "username");
  value.password = require_string(j, "password");
}

void to_json(nlohmann::json& j, const LoginResponse& value) {
  j = nlohmann::json{{"session", value.session}};
}

void from_json(const nlohmann::json& j, LoginResponse& value) {
  value.session = require_string(j, "session");
}

void to_json(nlohmann::json& j, const UserResponse& value) {
  j = nlohmann::json{{"username", value.username}};
}

void from_json(const nlohmann::json& j, UserResponse& value) {
  value.username = require_string(j, "username");
}

void to_json(nlohmann::json& j, const AddHistoryRequest& value) {
  j = nlohmann::json{{"id", value.id},
                     {"timestamp", history::to_rfc3339(value.timestamp)},
                     {"data", value.data},
                     {"hostname", value.hostname}};
  if (value.seq > 0) {
    j["seq"] = value.seq;
  }
}

void from_json(const nlohmann::json& j, AddHistoryRequest& value) {
  value.id = require_string(j, "id");
  value.timestamp = parse_timestamp(require_string(j, "timestamp"), "timestamp");
  value.data = require_string(j, "data");
  value.hostname = require_string(j, "hostname");
  if (value.id.empty()) {
    throw ProtocolError("field 'id' must not be empty");
  }
  value.seq = j.contains("seq") ? require_int64(j, "seq") : 0;
  if (value.seq < 0) {
    throw ProtocolError("field 'seq' must not be negative");
  }
}

void to_json(nlohmann::json& j, const CountResponse& value) {
  j = nlohmann::json{{"count", value.count}};
}

void from_json(const nlohmann::json& j, CountResponse& value) {
  value.count = require_int64(j, "count");
  if (value.count < 0) {
    throw ProtocolError("field 'count' must not be negative");
  }
}

void to_json(nlohmann::json& j, const SyncHistoryResponse& value) {
  j = nlohmann::json{{"history", value.history}, {"sync_ts", history::to_rfc3339(value.sync_ts)}};
}

void from_json(const nlohmann::json& j, SyncHistoryResponse& value) {
  const auto& history = require_field(j, "history");
  if (!history.is_array()) {
    throw ProtocolError("field 'history' must be an array");
  }
  value.history.clear();
  value.history.reserve(history.size());
  for (const auto& item : history) {
    value.history.push_back(item.get<AddHistoryRequest>());
  }
  value.sync_ts = j.contains("sync_ts") ? parse_timestamp(require_string(j, "sync_ts"), "sync_ts")
                                        : history::epoch();
}

void to_json(nlohmann::json& j, const ErrorResponse& value) {
  j = nlohmann::json{{"reason", value.reason}};
}

void from_json(const nlohmann::json& j, ErrorResponse& value) {
  value.reason = require_string(j, "reason");
}

//==============================================
// QUERY PARAMETERS
//==============================================

QueryParams to_query(const SyncHistoryRequest& request) {
  return QueryParams{
      {"sync_ts", history::to_rfc3339(request.sync_ts)},
      {"history_ts", history::to_rfc3339(request.history_ts)},
      {"host", request.host},
      {"page_size", std::to_string(request.page_size)},
      {"after_seq", std::to_string(request.after_seq)},
  };
}

SyncHistoryRequest sync_request_from_query(const QueryParams& params) {
  auto require = [&](const char* key) -> const std::string& {
    auto it = params.find(key);
    if (it == params.end()) {
      throw ProtocolError(std::string("missing query parameter '") + key + "'");
    }
    return it->second;
  };

  auto is_count = [](const std::string& text, std::size_t max_digits) {
    return !text.empty() && text.size() <= max_digits
        && text.find_first_not_of("0123456789") == std::string::npos;
  };

  SyncHistoryRequest request;
  request.sync_ts = parse_timestamp(require("sync_ts"), "sync_ts");
  request.history_ts = parse_timestamp(require("history_ts"), "history_ts");
  request.host = require("host");

  const std::string& page_size = require("page_size");
  if (!is_count(page_size, 9)) {
    throw ProtocolError("query parameter 'page_size' must be a positive integer");
  }
  request.page_size = static_cast<std::size_t>(std::stoul(page_size));
  if (request.page_size == 0) {
    throw ProtocolError("query parameter 'page_size' must be a positive integer");
  }

  // absent means from the start of the relay's history
  if (auto it = params.find("after_seq"); it != params.end()) {
    if (!is_count(it->second, 18)) {
      throw ProtocolError("query parameter 'after_seq' must be a non-negative integer");
    }
    request.after_seq = std::stoll(it->second);
  }
  return request;
}

std::string url_encode(const std::string& value) {
  std::ostringstream encoded;
  encoded << std::hex << std::uppercase;
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded << c;
    } else {
      encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
  }
  return encoded.str();
}

std::string url_decode(const std::string& value) {
  auto hex_value = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };

  std::string decoded;
  decoded.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%') {
      if (i + 2 >= value.size()) {
        throw ProtocolError("truncated percent escape in query");
      }
      const int high = hex_value(value[i + 1]);
      const int low = hex_value(value[i + 2]);
      if (high < 0 || low < 0) {
        throw ProtocolError("invalid percent escape in query");
      }
      decoded.push_back(static_cast<char>(high * 16 + low));
      i += 2;
    } else if (value[i] == '+') {
      decoded.push_back(' ');
    } else {
      decoded.push_back(value[i]);
    }
  }
  return decoded;
}

std::string build_query_string(const QueryParams& params) {
  std::string query;
  for (const auto& [key, value] : params) {
    if (!query.empty()) {
      query += '&';
    }
    query += url_encode(key) + '=' + url_encode(value);
  }
  return query;
}

QueryParams parse_query_string(const std::string& query) {
  QueryParams params;
  std::size_t start = 0;
  while (start < query.size()) {
    std::size_t end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }
    const std::string pair = query.substr(start, end - start);
    if (!pair.empty()) {
      const std::size_t eq = pair.find('=');
      if (eq == std::string::npos) {
        params[url_decode(pair)] = "";
      } else {
        params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
      }
    }
    start = end + 1;
  }
  return params;
}

//==============================================
// BLOB MAPPING
//==============================================

AddHistoryRequest to_wire(const crypto::EncryptedBlob& blob) {
  AddHistoryRequest request;
  request.id = blob.id;
  request.timestamp = blob.timestamp;
  request.hostname = blob.hostname;
  request.data = nlohmann::json{{"nonce", crypto::base64_encode(blob.nonce)},
                                {"ciphertext", crypto::base64_encode(blob.ciphertext)}}.dump();
  return request;
}

crypto::EncryptedBlob from_wire(const AddHistoryRequest& request) {
  nlohmann::json data;
  try {
    data = nlohmann::json::parse(request.data);
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "API: Blob " << request.id << " carries malformed data";
    throw ProtocolError("blob " + request.id + " data is not JSON: " + e.what());
  }

  crypto::EncryptedBlob blob;
  blob.id = request.id;
  blob.timestamp = request.timestamp;
  blob.hostname = request.hostname;
  try {
    blob.nonce = crypto::base64_decode(require_string(data, "nonce"));
    blob.ciphertext = crypto::base64_decode(require_string(data, "ciphertext"));
  } catch (const crypto::CryptoError& e) {
    throw ProtocolError("blob " + request.id + " data is not valid base64: " + e.what());
  }
  return blob;
}

} // namespace histvault::api
