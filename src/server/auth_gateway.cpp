#include "server/auth_gateway.hpp"
#include "crypto/crypto_error.hpp"
#include "crypto/encoding.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <sstream>
#include <vector>

namespace histvault::server {

namespace {

constexpr const char* kHashScheme = "pbkdf2-sha256";

std::vector<uint8_t> pbkdf2(const std::string& password, const std::vector<uint8_t>& salt, int iterations,
                            std::size_t size) {
  std::vector<uint8_t> output(size);
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                        salt.data(), static_cast<int>(salt.size()),
                        iterations, EVP_sha256(),
                        static_cast<int>(output.size()), output.data()) != 1) {
    throw crypto::CryptoError("Auth: PBKDF2 derivation failed");
  }
  return output;
}

} // namespace

AuthGateway::AuthGateway(ServerDatabase& database, bool open_registration)
  : database_(database)
  , open_registration_(open_registration) {}

//==============================================
// ACCOUNT OPERATIONS
//==============================================

api::RegisterResponse AuthGateway::register_user(const api::RegisterRequest& request) {
  if (!open_registration_) {
    BOOST_LOG_TRIVIAL(warning) << "Auth: Registration attempt while registration is closed";
    throw ApiError(403, "this server is not open for registrations");
  }
  if (request.username.empty() || request.email.empty() || request.password.empty()) {
    throw ApiError(400, "username, email and password are required");
  }

  NewUser user{request.username, request.email, hash_password(request.password)};
  auto created = database_.add_user(user);
  if (!created) {
    throw ApiError(409, "username or email already in use");
  }

  BOOST_LOG_TRIVIAL(info) << "Auth: Registered user " << created->username;
  return api::RegisterResponse{new_session(created->id)};
}

api::LoginResponse AuthGateway::login(const api::LoginRequest& request) {
  auto user = database_.get_user(request.username);
  if (!user || !verify_password(request.password, user->password)) {
    BOOST_LOG_TRIVIAL(warning) << "Auth: Failed login for " << request.username;
    throw ApiError(401, "invalid username or password");
  }

  BOOST_LOG_TRIVIAL(info) << "Auth: User " << user->username << " logged in";
  return api::LoginResponse{new_session(user->id)};
}

User AuthGateway::authenticate(const std::string& authorization) {
  const std::string prefix = "Token ";
  if (authorization.compare(0, prefix.size(), prefix) != 0 || authorization.size() == prefix.size()) {
    throw ApiError(401, "missing or malformed authorization header");
  }

  auto user = database_.get_session_user(authorization.substr(prefix.size()));
  if (!user) {
    BOOST_LOG_TRIVIAL(debug) << "Auth: Rejected unknown session token";
    throw ApiError(401, "invalid session token");
  }
  return *user;
}

std::string AuthGateway::new_session(int64_t user_id) {
  const auto bytes = crypto::random_bytes(TOKEN_SIZE);
  std::string token = crypto::hex_encode(bytes.data(), bytes.size());
  database_.add_session(user_id, token);
  return token;
}

//==============================================
// PASSWORD HASHING
//==============================================

std::string AuthGateway::hash_password(const std::string& password) {
  const auto salt = crypto::random_bytes(SALT_SIZE);
  const auto hash = pbkdf2(password, salt, PBKDF2_ITERATIONS, HASH_SIZE);

  std::ostringstream encoded;
  encoded << kHashScheme << '$' << PBKDF2_ITERATIONS << '$'
          << crypto::base64_encode(salt) << '$' << crypto::base64_encode(hash);
  return encoded.str();
}

bool AuthGateway::verify_password(const std::string& password, const std::string& encoded) {
  std::vector<std::string> parts;
  std::istringstream stream(encoded);
  std::string part;
  while (std::getline(stream, part, '$')) {
    parts.push_back(part);
  }
  if (parts.size() != 4 || parts[0] != kHashScheme) {
    BOOST_LOG_TRIVIAL(error) << "Auth: Stored password hash has an unknown format";
    return false;
  }

  int iterations = 0;
  std::vector<uint8_t> salt;
  std::vector<uint8_t> expected;
  try {
    iterations = std::stoi(parts[1]);
    salt = crypto::base64_decode(parts[2]);
    expected = crypto::base64_decode(parts[3]);
  } catch (const std::invalid_argument& e) {
    BOOST_LOG_TRIVIAL(error) << "Auth: Stored password hash is corrupt: " << e.what();
    return false;
  } catch (const std::out_of_range& e) {
    BOOST_LOG_TRIVIAL(error) << "Auth: Stored password hash is corrupt: " << e.what();
    return false;
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Auth: Stored password hash is corrupt: " << e.what();
    return false;
  }
  if (iterations <= 0 || expected.empty()) {
    return false;
  }

  const auto actual = pbkdf2(password, salt, iterations, expected.size());
  return CRYPTO_memcmp(actual.data(), expected.data(), expected.size()) == 0;
}

} // namespace histvault::server
