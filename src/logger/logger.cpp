#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace brightchain::logging {

namespace expr = boost::log::expressions;

void init_logging(const std::string& log_file, severity min_level) {
  try {
    boost::log::core::get()->remove_all_sinks();

    auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::trunc);
    backend->auto_flush(true);

    using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);
    sink->set_formatter(
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "] "
        << expr::smessage);

    boost::log::core::get()->add_sink(sink);
    boost::log::add_common_attributes();
    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Writing to " << log_path.string();
  } catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging(severity min_level) {
  boost::log::core::get()->remove_all_sinks();
  boost::log::add_console_log(
    std::clog,
    boost::log::keywords::format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "] "
        << expr::smessage),
    boost::log::keywords::auto_flush = true);
  boost::log::add_common_attributes();
  set_log_level(min_level);
  boost::log::core::get()->set_logging_enabled(true);
}

void set_log_level(severity min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

severity parse_severity(const std::string& name) {
  severity level;
  if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
    throw std::invalid_argument("Unknown log level: " + name);
  }
  return level;
}

} // namespace brightchain::logging
