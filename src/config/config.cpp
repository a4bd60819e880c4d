#include "config/config.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <thread>
#include <unordered_set>

namespace golink::config {

namespace {

// Whole-string unsigned parse with an upper bound; throws std::invalid_argument
std::size_t parse_number(const std::string& flag, const std::string& value, std::size_t min_value,
                         std::size_t max_value) {
  if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw std::invalid_argument("Invalid value for " + flag + ": " + value);
  }

  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("Value out of range for " + flag + ": " + value);
  }

  if (parsed < min_value || parsed > max_value) {
    throw std::invalid_argument("Value out of range for " + flag + ": " + value);
  }
  return static_cast<std::size_t>(parsed);
}

} // namespace

std::size_t ServerConfig::default_worker_count() {
  return std::max<std::size_t>(2, std::thread::hardware_concurrency());
}

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -p, --port <port>          Port to listen on (default: 8080)\n"
      << "  -a, --address <addr>       Address to bind (default: 0.0.0.0)\n"
      << "  --hash-algorithm <name>    Digest used for identifiers (default: sha256)\n"
      << "  --hash-length <n>          Hex characters kept from the digest (default: 5)\n"
      << "  --state-dir <dir>          Where shortened URLs are stored (default: goto_state)\n"
      << "  --cache-size <n>           URLs kept in memory (default: 100)\n"
      << "  --workers <n>              Request worker threads (default: hardware threads)\n"
      << "  --read-timeout <seconds>   Drop connections that send no request in time (default: 30)\n"
      << "  --log-file <file>          Also write the log to <file>\n"
      << "  --log-level <level>        trace, debug, info, warning, error or fatal (default: info)\n"
      << "  -h, --help                 Show this help\n"
      << "Example: " << program_name << " --port 8080 --state-dir /var/lib/golink\n";
}

ProgramOptions parse_command_line(int argc, char* argv[], std::ostream& err) {
  static const std::unordered_set<std::string> known_flags = {
    "-p", "--port", "-a", "--address", "--hash-algorithm", "--hash-length", "--state-dir",
    "--cache-size", "--workers", "--read-timeout", "--log-file", "--log-level"
  };
  static const std::unordered_set<std::string> levels = {
    "trace", "debug", "info", "warning", "error", "fatal"
  };

  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "golink";

  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);

    if (flag == "-h" || flag == "--help") {
      options.show_help = true;
      print_usage(program_name, err);
      return options;
    }

    if (known_flags.count(flag) == 0) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    const std::string value(argv[i + 1]);
    ServerConfig& config = options.config;

    try {
      if (flag == "-p" || flag == "--port") {
        config.port = static_cast<uint16_t>(
          parse_number(flag, value, 0, std::numeric_limits<uint16_t>::max()));
      } else if (flag == "-a" || flag == "--address") {
        config.address = value;
      } else if (flag == "--hash-algorithm") {
        config.hash_algorithm = value;
      } else if (flag == "--hash-length") {
        config.hash_length = parse_number(flag, value, 1, std::numeric_limits<std::size_t>::max());
      } else if (flag == "--state-dir") {
        config.state_dir = value;
      } else if (flag == "--cache-size") {
        config.cache_size = parse_number(flag, value, 1, std::numeric_limits<std::size_t>::max());
      } else if (flag == "--workers") {
        config.workers = parse_number(flag, value, 1, 1024);
      } else if (flag == "--read-timeout") {
        config.read_timeout_seconds = parse_number(flag, value, 1, 86400);
      } else if (flag == "--log-file") {
        config.log_file = value;
      } else if (flag == "--log-level") {
        if (levels.count(value) == 0) {
          throw std::invalid_argument("Invalid log level: " + value);
        }
        config.log_level = value;
      }
    } catch (const std::invalid_argument& e) {
      err << "Error: " << e.what() << '\n';
      print_usage(program_name, err);
      return options;
    }
  }

  options.valid = true;
  return options;
}

} // namespace golink::config
