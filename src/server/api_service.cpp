#include "server/api_service.hpp"
#include "crypto/crypto_error.hpp"
#include "store/store_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace histvault::server {

namespace {

ApiResponse error_response(unsigned status, const std::string& reason) {
  return ApiResponse{status, api::dump_body(api::ErrorResponse{reason})};
}

void require_method(const ApiRequest& request, const char* method) {
  if (request.method != method) {
    throw ApiError(405, "method not allowed");
  }
}

} // namespace

ApiService::ApiService(ServerDatabase& database, AuthGateway& auth, std::size_t max_page_size)
  : database_(database)
  , auth_(auth)
  , max_page_size_(max_page_size) {}

//==============================================
// ACCOUNT OPERATIONS
//==============================================

api::RegisterResponse ApiService::register_user(const api::RegisterRequest& request) {
  return auth_.register_user(request);
}

api::LoginResponse ApiService::login(const api::LoginRequest& request) {
  return auth_.login(request);
}

api::UserResponse ApiService::get_user(const std::string& username) {
  auto user = database_.get_user(username);
  if (!user) {
    throw ApiError(404, "user not found");
  }
  return api::UserResponse{user->username};
}

User ApiService::authenticate(const std::string& authorization) {
  return auth_.authenticate(authorization);
}

//==============================================
// HISTORY OPERATIONS
//==============================================

void ApiService::add_history(const User& user, const std::vector<api::AddHistoryRequest>& batch) {
  const auto inserted = database_.add_history(user.id, batch);
  BOOST_LOG_TRIVIAL(info) << "API service: User " << user.username << " uploaded " << batch.size()
                          << " blobs (" << inserted << " new)";
}

api::CountResponse ApiService::count(const User& user) {
  return api::CountResponse{database_.count_history(user.id)};
}

api::SyncHistoryResponse ApiService::sync_history(const User& user, const api::SyncHistoryRequest& request) {
  const std::size_t limit = std::min(request.page_size, max_page_size_);
  api::SyncHistoryResponse response;
  response.sync_ts = request.sync_ts == history::epoch() ? database_.ingestion_mark() : request.sync_ts;
  response.history = database_.list_history(user.id, response.sync_ts, request.history_ts, request.after_seq,
                                            request.host, limit);
  BOOST_LOG_TRIVIAL(debug) << "API service: Serving " << response.history.size() << " blobs to "
                           << user.username << " after seq " << request.after_seq;
  return response;
}

//==============================================
// ROUTING
//==============================================

ApiResponse ApiService::dispatch(const ApiRequest& request) {
  BOOST_LOG_TRIVIAL(debug) << "API service: " << request.method << " " << request.path;

  try {
    return route(request);
  } catch (const ApiError& e) {
    BOOST_LOG_TRIVIAL(info) << "API service: " << request.method << " " << request.path
                            << " -> " << e.status() << " " << e.what();
    return error_response(e.status(), e.what());
  } catch (const api::ProtocolError& e) {
    BOOST_LOG_TRIVIAL(info) << "API service: Bad request to " << request.path << ": " << e.what();
    return error_response(400, e.what());
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "API service: Database failure on " << request.path << ": " << e.what();
    return error_response(500, "internal server error");
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "API service: Crypto failure on " << request.path << ": " << e.what();
    return error_response(500, "internal server error");
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "API service: Unexpected failure on " << request.path << ": " << e.what();
    return error_response(500, "internal server error");
  }
}

ApiResponse ApiService::route(const ApiRequest& request) {
  const std::string& path = request.path;

  if (path == "/") {
    require_method(request, "GET");
    return ApiResponse{200, nlohmann::json{{"version", VERSION}}.dump()};
  }
  if (path == "/register") {
    require_method(request, "POST");
    return ApiResponse{200, api::dump_body(register_user(api::parse_body<api::RegisterRequest>(request.body)))};
  }
  if (path == "/login") {
    require_method(request, "POST");
    return ApiResponse{200, api::dump_body(login(api::parse_body<api::LoginRequest>(request.body)))};
  }

  const std::string user_prefix = "/user/";
  if (path.compare(0, user_prefix.size(), user_prefix) == 0) {
    require_method(request, "GET");
    const std::string username = api::url_decode(path.substr(user_prefix.size()));
    if (username.empty()) {
      throw ApiError(404, "user not found");
    }
    return ApiResponse{200, api::dump_body(get_user(username))};
  }

  if (path == "/history") {
    require_method(request, "POST");
    const User user = authenticate(request.authorization);
    add_history(user, api::parse_body<std::vector<api::AddHistoryRequest>>(request.body));
    return ApiResponse{200, "{}"};
  }
  if (path == "/sync/count") {
    require_method(request, "GET");
    const User user = authenticate(request.authorization);
    return ApiResponse{200, api::dump_body(count(user))};
  }
  if (path == "/sync/history") {
    require_method(request, "GET");
    const User user = authenticate(request.authorization);
    const auto sync_request = api::sync_request_from_query(api::parse_query_string(request.query));
    return ApiResponse{200, api::dump_body(sync_history(user, sync_request))};
  }

  throw ApiError(404, "not found");
}

} // namespace histvault::server
