#ifndef HISTVAULT_API_HTTP_API_CLIENT_HPP
#define HISTVAULT_API_HTTP_API_CLIENT_HPP

#include <chrono>
#include <string>
#include <boost/beast/http.hpp>
#include "api/sync_api.hpp"

namespace histvault::api {

struct ServerAddress {
  bool tls = false;
  std::string host;
  std::string port;
  std::string base_path;  // without trailing slash, may be empty
};

// Splits "http[s]://host[:port][/path]"; throws std::invalid_argument otherwise
ServerAddress parse_server_address(const std::string& url);


/*
 * Blocking HTTP(S) client for the relay API built on Boost.Beast.
 *
 * Every call opens a fresh connection, sends one request and reads one
 * response. Each network step is bounded by the configured timeout.
 */
class HttpApiClient : public SyncApi {
public:
  static constexpr const char* USER_AGENT = "histvault/1.0";

  // ---- CONSTRUCTOR ----
  HttpApiClient(const std::string& address, std::string session_token,
                std::chrono::seconds timeout = std::chrono::seconds(30));


  // ---- ACCOUNT OPERATIONS ----
  RegisterResponse register_user(const RegisterRequest& request);
  LoginResponse login(const LoginRequest& request);
  UserResponse get_user(const std::string& username);


  // ---- SYNC OPERATIONS ----
  CountResponse count() override;
  void add_history(const std::vector<AddHistoryRequest>& batch) override;
  SyncHistoryResponse sync_history(const SyncHistoryRequest& request) override;


  // ---- GETTERS AND SETTERS ----
  void set_session_token(const std::string& token) { session_token_ = token; }
  const ServerAddress& address() const { return address_; }

private:
  using Request = boost::beast::http::request<boost::beast::http::string_body>;

  struct Response {
    unsigned status = 0;
    std::string body;
  };

  // ---- PARAMETERS ----
  ServerAddress address_;
  std::string session_token_;
  std::chrono::seconds timeout_;


  // ---- REQUEST HANDLING ----
  // Sends one request and returns a 2xx response, throws TransportError otherwise
  Response perform(boost::beast::http::verb verb, const std::string& target,
                   const std::string& body, bool authenticated);
  Response send_plain(Request& request);
  Response send_tls(Request& request);
};

} // namespace histvault::api

#endif // HISTVAULT_API_HTTP_API_CLIENT_HPP
