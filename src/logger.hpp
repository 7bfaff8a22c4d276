#pragma once
/*
 * Logger
 *
 * Purpose: Boost.Log severity logger shared by every module.
 * Note: the terminal is in raw mode while tally runs, so records go to a
 *       file sink or nowhere; never to the console.
 */
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <filesystem>
#include <ostream>
#include <string>

enum class severity_level {
  trace,
  debug,
  info,
  warning,
  error,
  fatal
};

const char* to_string(severity_level level);
std::ostream& operator<<(std::ostream& strm, severity_level level);
bool parse_severity(const std::string& name, severity_level& out);

using severity_logger_type = boost::log::sources::severity_logger<severity_level>;

BOOST_LOG_GLOBAL_LOGGER(tally_logger, severity_logger_type)

// appends to log_file; false with msg if the sink can not be set up
bool init_logging(const std::filesystem::path& log_file, severity_level min_level, std::string& msg);
// drops every sink and turns the core off (also silences the default console sink)
void disable_logging();

#define LOG_TRACE BOOST_LOG_SEV(tally_logger::get(), severity_level::trace)
#define LOG_DEBUG BOOST_LOG_SEV(tally_logger::get(), severity_level::debug)
#define LOG_INFO BOOST_LOG_SEV(tally_logger::get(), severity_level::info)
#define LOG_WARN BOOST_LOG_SEV(tally_logger::get(), severity_level::warning)
#define LOG_ERROR BOOST_LOG_SEV(tally_logger::get(), severity_level::error)
#define LOG_FATAL BOOST_LOG_SEV(tally_logger::get(), severity_level::fatal)
