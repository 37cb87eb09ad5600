#ifndef BRIGHTCHAIN_LOGGER_HPP
#define BRIGHTCHAIN_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace brightchain::logging {

using severity = boost::log::trivial::severity_level;

// Replaces every sink with a synchronous text file sink
void init_logging(const std::string& log_file = "brightchain.log", severity min_level = severity::info);
// Console sink for tools and tests
void init_console_logging(severity min_level = severity::info);
void set_log_level(severity min_level);

// Accepts trace, debug, info, warning, error and fatal; throws std::invalid_argument otherwise
severity parse_severity(const std::string& name);

} // namespace brightchain::logging

#endif // BRIGHTCHAIN_LOGGER_HPP
