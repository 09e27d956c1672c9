#include "api/http_api_client.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/log/trivial.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <stdexcept>

namespace histvault::api {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

// Starts one asynchronous operation and runs ioc until it completes or the
// timeout elapses. The operation's error code is returned.
template <typename Initiation>
boost::system::error_code run_until_complete(boost::asio::io_context& ioc, std::chrono::seconds timeout,
                                             Initiation&& initiate) {
  boost::system::error_code result = boost::asio::error::would_block;
  initiate([&result](const boost::system::error_code& ec, auto&&...) { result = ec; });
  ioc.restart();
  ioc.run_for(timeout);
  if (result == boost::asio::error::would_block) {
    return beast::error::timeout;
  }
  return result;
}

[[noreturn]] void throw_network_error(const char* step, const boost::system::error_code& ec) {
  BOOST_LOG_TRIVIAL(error) << "HTTP client: " << step << " failed: " << ec.message();

  if (ec == beast::error::timeout || ec == boost::asio::error::timed_out) {
    throw TransportError(TransportError::Kind::Timeout, std::string(step) + " timed out");
  }
  if (ec == boost::asio::error::connection_refused) {
    throw TransportError(TransportError::Kind::ConnectionRefused, std::string(step) + ": connection refused");
  }
  throw TransportError(TransportError::Kind::Network, std::string(step) + ": " + ec.message());
}

tcp::resolver::results_type resolve(boost::asio::io_context& ioc, const ServerAddress& address,
                                    std::chrono::seconds timeout) {
  tcp::resolver resolver(ioc);
  tcp::resolver::results_type endpoints;
  auto ec = run_until_complete(ioc, timeout, [&](auto handler) {
    resolver.async_resolve(address.host, address.port,
      [&endpoints, handler](const boost::system::error_code& error, tcp::resolver::results_type results) mutable {
        endpoints = std::move(results);
        handler(error);
      });
  });
  if (ec) {
    throw_network_error("resolve", ec);
  }
  return endpoints;
}

// Writes the request and reads the response on an already connected stream
template <typename Stream>
http::response<http::string_body> exchange(boost::asio::io_context& ioc, Stream& stream,
                                           http::request<http::string_body>& request,
                                           std::chrono::seconds timeout) {
  beast::get_lowest_layer(stream).expires_after(timeout);
  auto ec = run_until_complete(ioc, timeout, [&](auto handler) {
    http::async_write(stream, request, handler);
  });
  if (ec) {
    throw_network_error("write", ec);
  }

  beast::flat_buffer buffer;
  http::response<http::string_body> response;
  beast::get_lowest_layer(stream).expires_after(timeout);
  ec = run_until_complete(ioc, timeout, [&](auto handler) {
    http::async_read(stream, buffer, response, handler);
  });
  if (ec) {
    throw_network_error("read", ec);
  }
  return response;
}

} // namespace

//==============================================
// ADDRESS PARSING
//==============================================

ServerAddress parse_server_address(const std::string& url) {
  ServerAddress address;
  std::string rest;
  if (url.rfind("https://", 0) == 0) {
    address.tls = true;
    rest = url.substr(8);
  } else if (url.rfind("http://", 0) == 0) {
    rest = url.substr(7);
  } else {
    throw std::invalid_argument("Unsupported server address (expected http:// or https://): " + url);
  }

  const std::size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    address.base_path = rest.substr(slash);
    while (!address.base_path.empty() && address.base_path.back() == '/') {
      address.base_path.pop_back();
    }
  }

  const std::size_t colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    address.host = authority.substr(0, colon);
    address.port = authority.substr(colon + 1);
  } else {
    address.host = authority;
    address.port = address.tls ? "443" : "80";
  }

  if (address.host.empty() || address.port.empty()
      || address.port.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("Malformed server address: " + url);
  }
  return address;
}

//==============================================
// CONSTRUCTOR
//==============================================

HttpApiClient::HttpApiClient(const std::string& address, std::string session_token,
                             std::chrono::seconds timeout)
  : address_(parse_server_address(address))
  , session_token_(std::move(session_token))
  , timeout_(timeout) {
  BOOST_LOG_TRIVIAL(debug) << "HTTP client: Using server " << (address_.tls ? "https://" : "http://")
                           << address_.host << ":" << address_.port << address_.base_path;
}

//==============================================
// ACCOUNT OPERATIONS
//==============================================

RegisterResponse HttpApiClient::register_user(const RegisterRequest& request) {
  auto response = perform(http::verb::post, "/register", dump_body(request), false);
  return parse_body<RegisterResponse>(response.body);
}

LoginResponse HttpApiClient::login(const LoginRequest& request) {
  auto response = perform(http::verb::post, "/login", dump_body(request), false);
  return parse_body<LoginResponse>(response.body);
}

UserResponse HttpApiClient::get_user(const std::string& username) {
  auto response = perform(http::verb::get, "/user/" + url_encode(username), "", false);
  return parse_body<UserResponse>(response.body);
}

//==============================================
// SYNC OPERATIONS
//==============================================

CountResponse HttpApiClient::count() {
  auto response = perform(http::verb::get, "/sync/count", "", true);
  return parse_body<CountResponse>(response.body);
}

void HttpApiClient::add_history(const std::vector<AddHistoryRequest>& batch) {
  BOOST_LOG_TRIVIAL(debug) << "HTTP client: Uploading batch of " << batch.size() << " blobs";
  perform(http::verb::post, "/history", nlohmann::json(batch).dump(), true);
}

SyncHistoryResponse HttpApiClient::sync_history(const SyncHistoryRequest& request) {
  const std::string target = "/sync/history?" + build_query_string(to_query(request));
  auto response = perform(http::verb::get, target, "", true);
  return parse_body<SyncHistoryResponse>(response.body);
}

//==============================================
// REQUEST HANDLING
//==============================================

HttpApiClient::Response HttpApiClient::perform(http::verb verb, const std::string& target,
                                               const std::string& body, bool authenticated) {
  Request request{verb, address_.base_path + target, 11};
  request.set(http::field::host, address_.host);
  request.set(http::field::user_agent, USER_AGENT);
  request.set(http::field::accept, "application/json");
  if (authenticated) {
    request.set(http::field::authorization, "Token " + session_token_);
  }
  if (!body.empty()) {
    request.set(http::field::content_type, "application/json");
    request.body() = body;
  }
  request.prepare_payload();

  BOOST_LOG_TRIVIAL(debug) << "HTTP client: " << verb << " " << request.target();

  Response response = address_.tls ? send_tls(request) : send_plain(request);

  BOOST_LOG_TRIVIAL(debug) << "HTTP client: " << request.target() << " -> " << response.status;

  if (response.status < 200 || response.status >= 300) {
    std::string reason;
    try {
      reason = parse_body<ErrorResponse>(response.body).reason;
    } catch (const ProtocolError&) {
      reason = response.body;
    }
    BOOST_LOG_TRIVIAL(warning) << "HTTP client: Server returned " << response.status << ": " << reason;
    throw TransportError(TransportError::Kind::Status,
                         "server returned " + std::to_string(response.status) + ": " + reason,
                         response.status, reason);
  }
  return response;
}

HttpApiClient::Response HttpApiClient::send_plain(Request& request) {
  boost::asio::io_context ioc;
  const auto endpoints = resolve(ioc, address_, timeout_);

  beast::tcp_stream stream(ioc);
  stream.expires_after(timeout_);
  auto ec = run_until_complete(ioc, timeout_, [&](auto handler) {
    stream.async_connect(endpoints, handler);
  });
  if (ec) {
    throw_network_error("connect", ec);
  }

  auto response = exchange(ioc, stream, request, timeout_);

  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP client: Shutdown reported: " << ec.message();
  }
  return Response{response.result_int(), std::move(response.body())};
}

HttpApiClient::Response HttpApiClient::send_tls(Request& request) {
  boost::asio::io_context ioc;
  ssl::context context(ssl::context::tls_client);
  context.set_default_verify_paths();
  context.set_verify_mode(ssl::verify_peer);
  context.set_verify_callback(ssl::host_name_verification(address_.host));

  const auto endpoints = resolve(ioc, address_, timeout_);

  beast::ssl_stream<beast::tcp_stream> stream(ioc, context);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), address_.host.c_str())) {
    boost::system::error_code ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
    throw_network_error("set SNI", ec);
  }

  beast::get_lowest_layer(stream).expires_after(timeout_);
  auto ec = run_until_complete(ioc, timeout_, [&](auto handler) {
    beast::get_lowest_layer(stream).async_connect(endpoints, handler);
  });
  if (ec) {
    throw_network_error("connect", ec);
  }

  beast::get_lowest_layer(stream).expires_after(timeout_);
  ec = run_until_complete(ioc, timeout_, [&](auto handler) {
    stream.async_handshake(ssl::stream_base::client, handler);
  });
  if (ec) {
    throw_network_error("TLS handshake", ec);
  }

  auto response = exchange(ioc, stream, request, timeout_);

  beast::get_lowest_layer(stream).expires_after(timeout_);
  ec = run_until_complete(ioc, timeout_, [&](auto handler) {
    stream.async_shutdown(handler);
  });
  if (ec && ec != ssl::error::stream_truncated) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP client: TLS shutdown reported: " << ec.message();
  }
  return Response{response.result_int(), std::move(response.body())};
}

} // namespace histvault::api
