#include "logger/logger.hpp"
#include "core/error.hpp"
#include <filesystem>
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/support/date_time.hpp>

namespace pasteall::logging {

severity_level parse_severity(const std::string& name) {
    if (name == "trace")   return severity_level::trace;
    if (name == "debug")   return severity_level::debug;
    if (name == "info")    return severity_level::info;
    if (name == "warning") return severity_level::warning;
    if (name == "error")   return severity_level::error;
    if (name == "fatal")   return severity_level::fatal;
    throw core::ConfigError("Unknown log level '" + name + "'");
}

std::string severity_to_string(severity_level level) {
    return boost::log::trivial::to_string(level);
}

void init_logging(severity_level min_level, const std::string& log_file) {
    namespace expr = boost::log::expressions;
    namespace keywords = boost::log::keywords;

    auto format = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "]"
        << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage;

    try {
        boost::log::core::get()->remove_all_sinks();

        boost::log::add_console_log(
            std::clog,
            keywords::format = format,
            keywords::auto_flush = true
        );

        if (!log_file.empty()) {
            const auto log_path = std::filesystem::absolute(log_file);
            boost::log::add_file_log(
                keywords::file_name = log_path.string(),
                keywords::format = format,
                keywords::open_mode = std::ios::out | std::ios::app,
                keywords::rotation_size = 10 * 1024 * 1024,
                keywords::auto_flush = true
            );
        }

        boost::log::add_common_attributes();
        boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
        boost::log::core::get()->set_logging_enabled(true);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }

    BOOST_LOG_TRIVIAL(debug) << "Logger: Initialized at level " << severity_to_string(min_level)
                             << (log_file.empty() ? "" : ", file " + log_file);
}

} // namespace pasteall::logging
