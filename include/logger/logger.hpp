#ifndef GOLINK_LOGGER_HPP
#define GOLINK_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace golink::logger {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a console sink and, when log_file is non-empty, an
// auto-flushing file sink. Call sites keep using BOOST_LOG_TRIVIAL.
void init_logging(const std::string& log_file = "",
                  severity_level min_level = severity_level::info);

// Adjusts the core filter after initialization
void set_log_level(severity_level min_level);

// Maps "trace" ... "fatal" onto a severity; false for unknown names
bool parse_severity(const std::string& name, severity_level& level);

} // namespace golink::logger

#endif // GOLINK_LOGGER_HPP
