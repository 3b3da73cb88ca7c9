#ifndef NEBULA_LOGGER_HPP
#define NEBULA_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace nebula::logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces all sinks with a file sink at log_file and filters below min_level
void init_logging(const std::string& log_file = "nebula.log",
                  severity_level min_level = boost::log::trivial::info);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();
// Flushes and detaches every sink
void shutdown_logging();

// Accepts trace, debug, info, warn/warning, error, fatal (any case).
// Throws store::InvalidInputError otherwise.
severity_level parse_log_level(const std::string& level);
const char* level_to_string(severity_level level);

} // namespace nebula::logging

#endif // NEBULA_LOGGER_HPP
