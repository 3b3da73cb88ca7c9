#include "logger/logger.hpp"
#include "store/store_error.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace nebula::logging {

void init_logging(const std::string& log_file, severity_level min_level) {
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    if (log_path.has_parent_path()) {
      std::filesystem::create_directories(log_path.parent_path());
    }

    boost::log::add_file_log(
      keywords::file_name = log_path.string(),
      keywords::open_mode = std::ios::out | std::ios::app,
      keywords::format = (
        expr::stream
          << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
          << " [" << boost::log::trivial::severity << "]"
          << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
          << " " << expr::smessage
      ),
      keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
      keywords::auto_flush = true
    );

    boost::log::add_common_attributes();
    set_log_level(min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string()
                            << " at level " << level_to_string(min_level);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
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

void shutdown_logging() {
  boost::log::core::get()->flush();
  boost::log::core::get()->remove_all_sinks();
}

severity_level parse_log_level(const std::string& level) {
  std::string lowered = level;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace") return boost::log::trivial::trace;
  if (lowered == "debug") return boost::log::trivial::debug;
  if (lowered == "info") return boost::log::trivial::info;
  if (lowered == "warn" || lowered == "warning") return boost::log::trivial::warning;
  if (lowered == "error") return boost::log::trivial::error;
  if (lowered == "fatal") return boost::log::trivial::fatal;

  throw store::InvalidInputError(level, "Logger: Invalid log level");
}

const char* level_to_string(severity_level level) {
  switch (level) {
    case boost::log::trivial::trace:   return "trace";
    case boost::log::trivial::debug:   return "debug";
    case boost::log::trivial::info:    return "info";
    case boost::log::trivial::warning: return "warning";
    case boost::log::trivial::error:   return "error";
    case boost::log::trivial::fatal:   return "fatal";
    default:                           return "unknown";
  }
}

} // namespace nebula::logging
