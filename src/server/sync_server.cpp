#include "server/sync_server.hpp"
#include "http_session.hpp"
#include <boost/log/trivial.hpp>

namespace histvault::server {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SyncServer::SyncServer(ApiService& service, const std::string& address, uint16_t port,
                       std::chrono::seconds timeout)
  : service_(service)
  , address_(address)
  , port_(port)
  , timeout_(timeout)
  , is_running_(false) {
  BOOST_LOG_TRIVIAL(info) << "Sync server: Initializing HTTP server on " << address << ":" << port;
}

SyncServer::~SyncServer() {
  shutdown();
}

//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool SyncServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Sync server: Server already running";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    port_ = acceptor_->local_endpoint().port();

    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "Sync server: Starting to accept connections";
    start_accept();

    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        boost::asio::io_context::work work(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Sync server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "Sync server: Listening on " << address_ << ":" << port_;
    return true;
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Sync server: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void SyncServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (!error) {
        boost::system::error_code endpoint_error;
        BOOST_LOG_TRIVIAL(debug) << "Sync server: Accepted connection from "
                                 << socket.remote_endpoint(endpoint_error);
        std::make_shared<HttpSession>(std::move(socket), service_, timeout_)->run();
      } else if (error == boost::asio::error::operation_aborted) {
        return;
      } else {
        BOOST_LOG_TRIVIAL(error) << "Sync server: Accept error: " << error.message();
      }
      start_accept();
    });
}

void SyncServer::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Sync server: Initiating server shutdown";

  is_running_ = false;

  // Stop io_context and wait for the IO thread before touching the acceptor
  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Sync server: Error closing acceptor: " << ec.message();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Sync server: Server shutdown complete";
}

} // namespace histvault::server
