#ifndef HISTVAULT_SERVER_AUTH_GATEWAY_HPP
#define HISTVAULT_SERVER_AUTH_GATEWAY_HPP

#include <string>
#include "api/api_types.hpp"
#include "server/api_error.hpp"
#include "server/server_database.hpp"

namespace histvault::server {

// Issues and validates session tokens. Failures are ApiError with the
// HTTP status to report.
class AuthGateway {
public:
  static constexpr int PBKDF2_ITERATIONS = 100000;
  static constexpr std::size_t SALT_SIZE = 16;
  static constexpr std::size_t HASH_SIZE = 32;
  static constexpr std::size_t TOKEN_SIZE = 32;

  AuthGateway(ServerDatabase& database, bool open_registration);

  // ---- ACCOUNT OPERATIONS ----
  api::RegisterResponse register_user(const api::RegisterRequest& request);
  api::LoginResponse login(const api::LoginRequest& request);
  // Resolves the user behind an "Authorization: Token <session>" header value
  User authenticate(const std::string& authorization);


  // ---- PASSWORD HASHING ----
  // "pbkdf2-sha256$<iterations>$<salt b64>$<hash b64>"
  static std::string hash_password(const std::string& password);
  static bool verify_password(const std::string& password, const std::string& encoded);

private:
  ServerDatabase& database_;
  bool open_registration_;

  std::string new_session(int64_t user_id);
};

} // namespace histvault::server

#endif // HISTVAULT_SERVER_AUTH_GATEWAY_HPP
