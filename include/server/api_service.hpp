#ifndef HISTVAULT_SERVER_API_SERVICE_HPP
#define HISTVAULT_SERVER_API_SERVICE_HPP

#include <string>
#include <vector>
#include "api/api_types.hpp"
#include "server/auth_gateway.hpp"
#include "server/server_database.hpp"

namespace histvault::server {

// Transport independent view of one HTTP request
struct ApiRequest {
  std::string method;         // "GET", "POST", ...
  std::string path;           // without query string
  std::string query;          // raw query string, without '?'
  std::string body;
  std::string authorization;  // Authorization header value, may be empty
};

struct ApiResponse {
  unsigned status = 200;
  std::string body;
};

/*
 * The relay's request handlers.
 *
 * The typed methods implement the API; dispatch routes a raw request to
 * them, validates bodies and renders failures as {"reason": ...}.
 */
class ApiService {
public:
  static constexpr const char* VERSION = "1.0.0";

  ApiService(ServerDatabase& database, AuthGateway& auth, std::size_t max_page_size);

  // ---- ACCOUNT OPERATIONS ----
  api::RegisterResponse register_user(const api::RegisterRequest& request);
  api::LoginResponse login(const api::LoginRequest& request);
  // 404 if the user does not exist
  api::UserResponse get_user(const std::string& username);
  User authenticate(const std::string& authorization);


  // ---- HISTORY OPERATIONS ----
  void add_history(const User& user, const std::vector<api::AddHistoryRequest>& batch);
  api::CountResponse count(const User& user);
  api::SyncHistoryResponse sync_history(const User& user, const api::SyncHistoryRequest& request);


  // ---- ROUTING ----
  ApiResponse dispatch(const ApiRequest& request);

private:
  ServerDatabase& database_;
  AuthGateway& auth_;
  std::size_t max_page_size_;

  ApiResponse route(const ApiRequest& request);
};

} // namespace histvault::server

#endif // HISTVAULT_SERVER_API_SERVICE_HPP
