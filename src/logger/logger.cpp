#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/formatter.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace golink::logger {

namespace {

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;

const logging::formatter& line_format() {
  static const logging::formatter format = expr::stream
    << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
    << " [" << logging::trivial::severity << "]"
    << " [" << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "] "
    << expr::smessage;
  return format;
}

} // namespace

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();

    // Console sink
    auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
    console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    console_backend->auto_flush(true);

    using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
    auto console = boost::make_shared<console_sink>(console_backend);
    console->set_formatter(line_format());
    logging::core::get()->add_sink(console);

    // Optional file sink
    if (!log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(log_file);

      auto file_backend = boost::make_shared<sinks::text_file_backend>();
      file_backend->set_file_name_pattern(log_path.string());
      file_backend->set_open_mode(std::ios::out | std::ios::app);
      file_backend->auto_flush(true);

      using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
      auto file = boost::make_shared<file_sink>(file_backend);
      file->set_formatter(line_format());
      logging::core::get()->add_sink(file);
    }

    logging::add_common_attributes();
    set_log_level(min_level);
    logging::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level min_level) {
  logging::core::get()->set_filter(logging::trivial::severity >= min_level);
}

bool parse_severity(const std::string& name, severity_level& level) {
  // trivial::from_string accepts exactly the lowercase level names
  return logging::trivial::from_string(name.c_str(), name.size(), level);
}

} // namespace golink::logger
