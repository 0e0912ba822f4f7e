#include "logger/logger.hpp"
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/support/date_time.hpp>

namespace cafs::logging {

void init_logging(const LogOptions& options) {
    namespace logging = boost::log;
    namespace keywords = boost::log::keywords;
    namespace expr = boost::log::expressions;

    try {
        // Clear any existing sinks to prevent duplicates
        logging::core::get()->remove_all_sinks();

        auto format = (
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                << " [" << logging::trivial::severity << "]"
                << " " << expr::smessage
        );

        if (options.log_file.empty()) {
            logging::add_console_log(
                std::clog,
                keywords::format = format,
                keywords::auto_flush = true
            );
        } else {
            logging::add_file_log(
                keywords::file_name = options.log_file,
                keywords::format = format,
                keywords::rotation_size = options.rotation_size,
                keywords::open_mode = std::ios::out | std::ios::app,
                keywords::auto_flush = true
            );
        }

        logging::add_common_attributes();
        set_log_level(options.min_level);
        logging::core::get()->set_logging_enabled(true);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_log_level(severity_level level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

LogFn default_log() {
    return [](const std::string& message) {
        BOOST_LOG_TRIVIAL(info) << message;
    };
}

} // namespace cafs::logging
