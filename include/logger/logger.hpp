#ifndef CAFS_LOGGER_HPP
#define CAFS_LOGGER_HPP

#include <functional>
#include <string>
#include <boost/log/trivial.hpp>

namespace cafs::logging {

using severity_level = boost::log::trivial::severity_level;

// Operational log callback accepted by the stores and the content store
using LogFn = std::function<void(const std::string&)>;

struct LogOptions {
    // Empty means log to the console
    std::string log_file;
    severity_level min_level = severity_level::info;
    std::size_t rotation_size = 10 * 1024 * 1024;  // 10 MB
};

// Replaces all sinks with a console or rotating file sink
void init_logging(const LogOptions& options = LogOptions());

// Adjusts the minimum severity of the global filter
void set_log_level(severity_level level);

// Callback that forwards operational messages to the trivial logger at info
LogFn default_log();

} // namespace cafs::logging

#endif // CAFS_LOGGER_HPP
