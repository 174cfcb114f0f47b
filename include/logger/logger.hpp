#ifndef PASTEALL_LOGGER_HPP
#define PASTEALL_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace pasteall::logging {

using severity_level = boost::log::trivial::severity_level;

// Maps "trace".."fatal" to a severity, throws ConfigError for anything else
severity_level parse_severity(const std::string& name);
std::string severity_to_string(severity_level level);

/**
 * Installs the process-wide sinks: a console sink and, when log_file is not
 * empty, a text file sink rotating at 10 MiB. Existing sinks are replaced.
 */
void init_logging(severity_level min_level = severity_level::info,
                  const std::string& log_file = "");

} // namespace pasteall::logging

#endif // PASTEALL_LOGGER_HPP
