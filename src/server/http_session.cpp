#include "http_session.hpp"
#include <boost/log/trivial.hpp>

namespace histvault::server {

namespace beast = boost::beast;
namespace http = boost::beast::http;

HttpSession::HttpSession(boost::asio::ip::tcp::socket&& socket, ApiService& service,
                         std::chrono::seconds timeout)
  : stream_(std::move(socket))
  , service_(service)
  , timeout_(timeout) {}

void HttpSession::run() {
  do_read();
}

//==============================================
// READ AND DISPATCH
//==============================================

void HttpSession::do_read() {
  parser_.emplace();
  parser_->body_limit(BODY_LIMIT);
  stream_.expires_after(timeout_);

  http::async_read(stream_, buffer_, *parser_,
    [self = shared_from_this()](const beast::error_code& ec, std::size_t bytes) {
      self->on_read(ec, bytes);
    });
}

void HttpSession::on_read(const beast::error_code& ec, std::size_t bytes) {
  if (ec == http::error::end_of_stream) {
    do_close();
    return;
  }
  if (ec) {
    if (ec != beast::error::timeout && ec != boost::asio::error::operation_aborted) {
      BOOST_LOG_TRIVIAL(warning) << "HTTP session: Read failed: " << ec.message();
    }
    return;
  }

  BOOST_LOG_TRIVIAL(trace) << "HTTP session: Read " << bytes << " bytes";

  auto request = parser_->release();

  ApiRequest api_request;
  api_request.method = std::string(request.method_string());
  const std::string target(request.target());
  const std::size_t question = target.find('?');
  api_request.path = target.substr(0, question);
  if (question != std::string::npos) {
    api_request.query = target.substr(question + 1);
  }
  api_request.body = std::move(request.body());
  auto authorization = request.find(http::field::authorization);
  if (authorization != request.end()) {
    api_request.authorization = std::string(authorization->value());
  }

  const ApiResponse api_response = service_.dispatch(api_request);

  auto response = std::make_shared<http::response<http::string_body>>(
      static_cast<http::status>(api_response.status), request.version());
  response->set(http::field::server, "histvault");
  response->set(http::field::content_type, "application/json");
  response->keep_alive(request.keep_alive());
  response->body() = api_response.body;
  response->prepare_payload();

  send(std::move(response));
}

//==============================================
// WRITE AND CLOSE
//==============================================

void HttpSession::send(std::shared_ptr<http::response<http::string_body>> response) {
  stream_.expires_after(timeout_);
  http::async_write(stream_, *response,
    [self = shared_from_this(), response](const beast::error_code& ec, std::size_t) {
      if (ec) {
        BOOST_LOG_TRIVIAL(warning) << "HTTP session: Write failed: " << ec.message();
        return;
      }
      if (response->need_eof()) {
        self->do_close();
        return;
      }
      self->do_read();
    });
}

void HttpSession::do_close() {
  beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  if (ec && ec != beast::errc::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP session: Shutdown reported: " << ec.message();
  }
}

} // namespace histvault::server
