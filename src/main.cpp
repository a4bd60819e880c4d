#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include "config/config.hpp"
#include "http/request_handler.hpp"
#include "logger/logger.hpp"
#include "network/http_server.hpp"
#include "store/content_store.hpp"

namespace {

bool run_server(const golink::config::ServerConfig& config) {
  try {
    golink::store::ContentStore store(config.state_dir, config.hash_algorithm,
                                      config.hash_length, config.cache_size);
    golink::http::RequestHandler handler(store);
    golink::network::HttpServer server(config.address, config.port, handler, config.workers,
                                       std::chrono::seconds(config.read_timeout_seconds));

    if (!server.start_listener()) {
      BOOST_LOG_TRIVIAL(fatal) << "Error: Failed to start server on " << config.address << ":" << config.port;
      return false;
    }

    // Block until SIGINT/SIGTERM, then drain in-flight requests
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        BOOST_LOG_TRIVIAL(info) << "Received signal " << signal_number << ", shutting down";
      }
    });
    signal_context.run();

    server.shutdown();
    return true;
  } catch (const golink::store::UnsupportedAlgorithmError& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Error: " << e.what();
    return false;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Error: Failed to start server: " << e.what();
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = golink::config::parse_command_line(argc, argv);
  if (options.show_help) {
    return 0;
  } else if (!options.valid) {
    return 1;
  }

  golink::logger::severity_level level = golink::logger::severity_level::info;
  if (!golink::logger::parse_severity(options.config.log_level, level)) {
    std::cerr << "Error: Invalid log level: " << options.config.log_level << '\n';
    return 1;
  }

  try {
    golink::logger::init_logging(options.config.log_file, level);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }

  return run_server(options.config) ? 0 : 1;
}
