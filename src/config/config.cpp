#include "config/config.hpp"
#include "logger/logger.hpp"
#include "store/store_error.hpp"
#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace nebula {
namespace config {

namespace pt = boost::property_tree;

namespace {

// Present keys must convert; the throwing get<T> raises ptree_bad_data
template <typename T>
void read_value(const pt::ptree& tree, const std::string& key, T& target) {
  if (tree.get_child_optional(key)) {
    target = tree.get<T>(key);
  }
}

void read_value(const pt::ptree& tree, const std::string& key, std::filesystem::path& target) {
  if (tree.get_child_optional(key)) {
    target = tree.get<std::string>(key);
  }
}

// Parsed as signed text so "-1" is rejected instead of wrapping to SIZE_MAX
void read_size_bound(const pt::ptree& tree, const std::string& key, size_t& target) {
  boost::optional<std::string> text = tree.get_optional<std::string>(key);
  if (!text) {
    return;
  }

  long long value = 0;
  size_t consumed = 0;
  try {
    value = std::stoll(*text, &consumed);
  }
  catch (const std::logic_error&) {
    throw store::InvalidInputError(key, "Config: Chunk size bound is not a number: '" + *text + "'");
  }
  if (consumed != text->size()) {
    throw store::InvalidInputError(key, "Config: Chunk size bound is not a number: '" + *text + "'");
  }
  if (value <= 0) {
    throw store::InvalidInputError(key, "Config: Chunk size bound must be positive, got " + *text);
  }
  if (static_cast<unsigned long long>(value) > store::MAX_CHUNK_SIZE) {
    throw store::InvalidInputError(key, "Config: Chunk size bound exceeds "
                                   + std::to_string(store::MAX_CHUNK_SIZE) + ", got " + *text);
  }
  target = static_cast<size_t>(value);
}

} // namespace

std::filesystem::path Config::default_storage_dir() {
  const char* home = std::getenv("HOME");
  std::filesystem::path base = (home && *home) ? std::filesystem::path(home) : std::filesystem::path(".");
  return base / ".nebula" / "store";
}

Config Config::load_from_file(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Config: Loading configuration from: " << path.string();

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Config: Configuration file not found: " << path.string();
    throw store::NotFoundError(path.string(), "Config: Configuration file not found");
  }

  Config config;
  try {
    pt::ptree tree;
    pt::read_json(path.string(), tree);

    read_value(tree, "storage_dir", config.storage_dir);
    read_value(tree, "log_file", config.log_file);
    read_value(tree, "log_level", config.log_level);
    read_value(tree, "verify_on_read", config.verify_on_read);

    read_size_bound(tree, "chunker.min_size", config.chunker.min_size);
    read_size_bound(tree, "chunker.avg_size", config.chunker.avg_size);
    read_size_bound(tree, "chunker.max_size", config.chunker.max_size);
    read_value(tree, "chunker.content_defined", config.chunker.content_defined);
  }
  catch (const pt::ptree_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Config: Malformed configuration file " << path.string() << ": " << e.what();
    throw store::InvalidInputError(path.string(), std::string("Config: Malformed configuration: ") + e.what());
  }

  config.validate();
  BOOST_LOG_TRIVIAL(debug) << "Config: Storage directory " << config.storage_dir.string()
                           << ", log level " << config.log_level;
  return config;
}

void Config::save_to_file(const std::filesystem::path& path) const {
  BOOST_LOG_TRIVIAL(info) << "Config: Saving configuration to: " << path.string();

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw store::IoError(path.string(), "Config: Failed to create directory: " + ec.message());
    }
  }

  pt::ptree tree;
  tree.put("storage_dir", storage_dir.string());
  tree.put("log_file", log_file);
  tree.put("log_level", log_level);
  tree.put("verify_on_read", verify_on_read);
  tree.put("chunker.min_size", chunker.min_size);
  tree.put("chunker.avg_size", chunker.avg_size);
  tree.put("chunker.max_size", chunker.max_size);
  tree.put("chunker.content_defined", chunker.content_defined);

  try {
    pt::write_json(path.string(), tree);
  }
  catch (const pt::ptree_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to write configuration: " << e.what();
    throw store::IoError(path.string(), std::string("Config: Failed to write configuration: ") + e.what());
  }
}

void Config::validate() const {
  if (storage_dir.empty()) {
    throw store::InvalidInputError("Config: storage_dir must not be empty");
  }
  chunker.validate();
  logging::parse_log_level(log_level);
}

} // namespace config
} // namespace nebula
