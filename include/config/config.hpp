#ifndef GOLINK_CONFIG_HPP
#define GOLINK_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>

namespace golink::config {

inline constexpr const char* version = "1.2.0";

struct ServerConfig {
  uint16_t port{8080};
  std::string address{"0.0.0.0"};
  std::string hash_algorithm{"sha256"};
  std::size_t hash_length{5};
  std::string state_dir{"goto_state"};
  std::size_t cache_size{100};
  std::size_t workers{default_worker_count()};
  std::size_t read_timeout_seconds{30};
  std::string log_file;
  std::string log_level{"info"};

  static std::size_t default_worker_count();
};

struct ProgramOptions {
  ServerConfig config;
  bool valid{false};
  bool show_help{false};
};

void print_usage(const std::string& program_name, std::ostream& out);

// Reads "--flag value" pairs over the defaults in ServerConfig. Problems are
// reported on err together with the usage text and leave valid false.
ProgramOptions parse_command_line(int argc, char* argv[], std::ostream& err = std::cerr);

} // namespace golink::config

#endif // GOLINK_CONFIG_HPP
