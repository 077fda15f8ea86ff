#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/named_scope.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>

namespace chunkfs::logging {

// Define the global logger
BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, severity_logger_type) {
    severity_logger_type logger;

    // Add common attributes
    logger.add_attribute("TimeStamp", boost::log::attributes::local_clock());
    logger.add_attribute("Scope", boost::log::attributes::named_scope());

    return logger;
}

namespace {

// Timestamped single line format shared by every sink
template <typename Sink>
void set_record_format(Sink& sink) {
    namespace expr = boost::log::expressions;
    sink.set_formatter(
        expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << boost::log::trivial::severity << "] "
            << expr::smessage
    );
}

} // namespace

void init_logging(const std::string& log_file, severity_level min_level) {
    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();

        // Create and configure text file sink backend
        auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

        // Convert to absolute path
        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        backend->set_file_name_pattern(log_path.string());
        backend->set_open_mode(std::ios::out | std::ios::app);
        backend->auto_flush(true);

        // Create the sink
        using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
        auto sink = boost::make_shared<text_sink>(backend);
        set_record_format(*sink);

        // Add sink and attributes to the core
        boost::log::core::get()->add_sink(sink);
        boost::log::add_common_attributes();

        set_log_level(min_level);
        enable_logging();
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void init_console_logging(severity_level min_level) {
    boost::log::core::get()->remove_all_sinks();

    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);

    using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;
    auto sink = boost::make_shared<text_sink>(backend);
    set_record_format(*sink);

    boost::log::core::get()->add_sink(sink);
    boost::log::add_common_attributes();

    set_log_level(min_level);
    enable_logging();
}

void set_log_level(severity_level min_level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void enable_logging() {
    boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    boost::log::core::get()->set_logging_enabled(false);
}

} // namespace chunkfs::logging
