#include "network/http_server.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <vector>

namespace golink {
namespace network {

namespace beast = boost::beast;

//==============================================
// SESSION
//==============================================

// One accepted connection. Reads and writes run on the IO thread; only the
// request handler runs on the worker pool.
class HttpServer::Session : public std::enable_shared_from_this<HttpServer::Session> {
public:
  Session(HttpServer& server, boost::asio::ip::tcp::socket socket, std::uint64_t id)
    : server_(server)
    , stream_(std::move(socket))
    , id_(id)
    , reading_(false) {}

  ~Session() {
    server_.unregister_session(id_);
  }

  void start() {
    read_request();
  }

  // IO thread only. Connections already past the read are left to finish
  void cancel_if_idle() {
    if (reading_) {
      BOOST_LOG_TRIVIAL(debug) << "HTTP server: Dropping idle connection " << id_;
      close();
    }
  }

private:
  HttpServer& server_;
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::Request request_;
  http::Response response_;
  const std::uint64_t id_;
  bool reading_;

  void read_request() {
    reading_ = true;
    stream_.expires_after(server_.read_timeout_);
    beast::http::async_read(stream_, buffer_, request_,
      [self = shared_from_this()](beast::error_code ec, std::size_t) {
        self->on_read(ec);
      });
  }

  void on_read(beast::error_code ec) {
    reading_ = false;

    if (ec) {
      if (ec == beast::error::timeout) {
        BOOST_LOG_TRIVIAL(info) << "HTTP server: Connection " << id_ << " timed out waiting for a request";
      } else if (ec != beast::http::error::end_of_stream && ec != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(warning) << "HTTP server: Failed to read request: " << ec.message();
      }
      close();
      return;
    }

    stream_.expires_never();

    // The guard keeps the IO thread alive until the response is queued back
    auto guard = boost::asio::make_work_guard(server_.io_context_);
    boost::asio::post(*server_.workers_,
      [self = shared_from_this(), guard = std::move(guard)]() mutable {
        self->response_ = self->server_.handle_request(self->request_);
        boost::asio::post(self->stream_.get_executor(), [self]() { self->write_response(); });
        guard.reset();
      });
  }

  void write_response() {
    stream_.expires_after(server_.read_timeout_);
    beast::http::async_write(stream_, response_,
      [self = shared_from_this()](beast::error_code ec, std::size_t) {
        if (ec) {
          BOOST_LOG_TRIVIAL(warning) << "HTTP server: Failed to write response: " << ec.message();
        }
        self->close();
      });
  }

  void close() {
    beast::error_code ec;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
    stream_.socket().close(ec);
  }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const std::string& address, uint16_t port, http::RequestHandler& handler,
                       std::size_t worker_count, std::chrono::seconds read_timeout)
  : address_(address)
  , port_(port)
  , worker_count_(worker_count == 0 ? 1 : worker_count)
  , read_timeout_(read_timeout)
  , is_running_(false)
  , bound_port_(0)
  , next_session_id_(0)
  , handler_(handler) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on " << address << ":" << port
                          << " with " << worker_count_ << " workers";
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Acceptor created";
    io_context_.restart();
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_->local_endpoint().port();

    workers_ = std::make_unique<boost::asio::thread_pool>(worker_count_);
    work_.emplace(io_context_.get_executor());
    is_running_ = true;

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Serving on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    is_running_ = false;
    work_.reset();
    acceptor_.reset();
    workers_.reset();
    return false;
  }
}

void HttpServer::shutdown() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (!io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting and drop idle connections from the IO thread itself
  boost::asio::post(io_context_, [this]() {
    if (acceptor_ && acceptor_->is_open()) {
      boost::system::error_code ec;
      acceptor_->close(ec);
      if (ec) {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
      }
    }
    cancel_idle_sessions();
  });

  // run() returns once every in-flight request has been answered
  work_.reset();
  if (io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  if (workers_) {
    workers_->join();
    workers_.reset();
  }
  acceptor_.reset();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Server shutdown complete";
}

uint16_t HttpServer::port() const {
  return bound_port_ ? bound_port_.load() : port_;
}


//==============================================
// CONNECTION HANDLING
//==============================================

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (!error && !is_running_) {
        boost::system::error_code close_ec;
        socket.close(close_ec);  // Accepted just before shutdown closed the acceptor
        return;
      } else if (!error) {
        boost::system::error_code endpoint_ec;
        BOOST_LOG_TRIVIAL(debug) << "HTTP server: Accepted connection from "
                                 << socket.remote_endpoint(endpoint_ec);

        std::shared_ptr<Session> session;
        {
          std::lock_guard<std::mutex> lock(sessions_mutex_);
          const std::uint64_t id = next_session_id_++;
          session = std::make_shared<Session>(*this, std::move(socket), id);
          sessions_[id] = session;
        }
        session->start();
      } else if (error == boost::asio::error::operation_aborted) {
        return;  // Acceptor closed during shutdown
      } else {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

http::Response HttpServer::handle_request(const http::Request& request) {
  try {
    return handler_.handle(request);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Request failed: " << e.what();
    http::Response response{beast::http::status::internal_server_error, request.version()};
    response.set(beast::http::field::content_type, "text/plain");
    response.keep_alive(false);
    response.body() = "Internal Server Error";
    response.prepare_payload();
    return response;
  }
}

void HttpServer::cancel_idle_sessions() {
  std::vector<std::shared_ptr<Session>> live;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& entry : sessions_) {
      if (auto session = entry.second.lock()) {
        live.push_back(session);
      }
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "HTTP server: " << live.size() << " connections open at shutdown";
  for (auto& session : live) {
    session->cancel_if_idle();
  }
}

void HttpServer::unregister_session(std::uint64_t id) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.erase(id);
}

} // namespace network
} // namespace golink
