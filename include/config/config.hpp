#pragma once

#include <filesystem>
#include <string>
#include "store/chunker.hpp"

namespace nebula {
namespace config {

struct Config {
  std::filesystem::path storage_dir = default_storage_dir();
  std::string log_file = "nebula.log";
  std::string log_level = "info";
  store::ChunkerConfig chunker;
  bool verify_on_read = true;

  // $HOME/.nebula/store, or ./.nebula/store without a home directory
  static std::filesystem::path default_storage_dir();

  // Missing keys keep their defaults. Throws store::NotFoundError if the
  // file is absent and store::InvalidInputError if it is malformed.
  static Config load_from_file(const std::filesystem::path& path);
  void save_to_file(const std::filesystem::path& path) const;

  // Checks the chunk profile and log level
  void validate() const;
};

} // namespace config
} // namespace nebula
