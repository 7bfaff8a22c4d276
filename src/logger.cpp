#include "logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <exception>

BOOST_LOG_ATTRIBUTE_KEYWORD(log_severity, "Severity", severity_level)

const char* to_string(severity_level level) {
  switch (level) {
    case severity_level::trace:   return "TRACE";
    case severity_level::debug:   return "DEBUG";
    case severity_level::info:    return "INFO";
    case severity_level::warning: return "WARNING";
    case severity_level::error:   return "ERROR";
    case severity_level::fatal:   return "FATAL";
    default:                      return "UNKNOWN";
  }
}

std::ostream& operator<<(std::ostream& strm, severity_level level) {
  strm << to_string(level);
  return strm;
}

bool parse_severity(const std::string& name, severity_level& out) {
  static const std::pair<const char*, severity_level> names[] = {
    {"trace", severity_level::trace},
    {"debug", severity_level::debug},
    {"info", severity_level::info},
    {"warning", severity_level::warning},
    {"warn", severity_level::warning},
    {"error", severity_level::error},
    {"fatal", severity_level::fatal},
  };
  for (const auto& [n, lvl] : names) {
    if (name == n) { out = lvl; return true; }
  }
  return false;
}

BOOST_LOG_GLOBAL_LOGGER_INIT(tally_logger, severity_logger_type) {
  return severity_logger_type();
}

bool init_logging(const std::filesystem::path& log_file, severity_level min_level, std::string& msg) {
  namespace logging = boost::log;
  namespace sinks = boost::log::sinks;
  namespace expr = boost::log::expressions;
  try {
    logging::core::get()->remove_all_sinks();

    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    auto backend = boost::make_shared<sinks::text_file_backend>();
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::app);
    backend->auto_flush(true);

    using text_sink = sinks::synchronous_sink<sinks::text_file_backend>;
    auto sink = boost::make_shared<text_sink>(backend);
    sink->set_formatter(
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << log_severity << "] "
        << expr::smessage
    );

    logging::core::get()->add_sink(sink);
    logging::add_common_attributes();
    logging::core::get()->set_filter(log_severity >= min_level);
    logging::core::get()->set_logging_enabled(true);
  } catch (const std::exception& e) {
    msg = std::string("can not initialize logging: ") + e.what();
    disable_logging();
    return false;
  }
  return true;
}

void disable_logging() {
  boost::log::core::get()->remove_all_sinks();
  boost::log::core::get()->set_logging_enabled(false);
}
