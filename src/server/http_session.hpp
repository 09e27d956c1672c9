#ifndef HISTVAULT_SERVER_HTTP_SESSION_HPP
#define HISTVAULT_SERVER_HTTP_SESSION_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "server/api_service.hpp"

namespace histvault::server {

// One accepted connection. Reads requests, hands them to the ApiService and
// writes the responses back until the peer closes or keep-alive ends.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  static constexpr std::size_t BODY_LIMIT = 16 * 1024 * 1024;

  HttpSession(boost::asio::ip::tcp::socket&& socket, ApiService& service, std::chrono::seconds timeout);

  // Starts the read loop
  void run();

private:
  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
  ApiService& service_;
  std::chrono::seconds timeout_;

  void do_read();
  void on_read(const boost::beast::error_code& ec, std::size_t bytes);
  void send(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> response);
  void do_close();
};

} // namespace histvault::server

#endif // HISTVAULT_SERVER_HTTP_SESSION_HPP
