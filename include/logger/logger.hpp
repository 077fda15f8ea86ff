#ifndef CHUNKFS_LOGGER_HPP
#define CHUNKFS_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <string>

namespace chunkfs::logging {

// Same severity type as BOOST_LOG_TRIVIAL so one filter covers both
using severity_level = boost::log::trivial::severity_level;

// Declare the logger type
using severity_logger_type = boost::log::sources::severity_logger_mt<severity_level>;

// Declare the global logger storage
BOOST_LOG_GLOBAL_LOGGER(global_logger, severity_logger_type)

// Routes all records to a text file, replacing any existing sinks
void init_logging(const std::string& log_file = "chunkfs.log",
                  severity_level min_level = severity_level::info);

// Routes all records to stderr, replacing any existing sinks
void init_console_logging(severity_level min_level = severity_level::warning);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

} // namespace chunkfs::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_SEV(chunkfs::logging::global_logger::get(), boost::log::trivial::trace)
#define LOG_DEBUG BOOST_LOG_SEV(chunkfs::logging::global_logger::get(), boost::log::trivial::debug)
#define LOG_INFO BOOST_LOG_SEV(chunkfs::logging::global_logger::get(), boost::log::trivial::info)
#define LOG_WARN BOOST_LOG_SEV(chunkfs::logging::global_logger::get(), boost::log::trivial::warning)
#define LOG_ERROR BOOST_LOG_SEV(chunkfs::logging::global_logger::get(), boost::log::trivial::error)
#define LOG_FATAL BOOST_LOG_SEV(chunkfs::logging::global_logger::get(), boost::log::trivial::fatal)

#endif // CHUNKFS_LOGGER_HPP
