#ifndef NEBULA_TEST_UTILS_HPP
#define NEBULA_TEST_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

// Console logging for tests, warnings and above unless asked otherwise
inline void init_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
  // Remove any existing sinks to prevent duplicates
  boost::log::core::get()->remove_all_sinks();

  boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

  boost::log::add_console_log(
    std::cout,
    boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
    boost::log::keywords::auto_flush = true
  );

  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
  boost::log::add_common_attributes();
}

// Unique directory under the system temp dir
inline std::filesystem::path make_test_dir(const std::string& prefix) {
  static std::random_device rd;
  std::filesystem::path dir = std::filesystem::temp_directory_path() /
    (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count())
     + "_" + std::to_string(rd()));
  std::filesystem::create_directories(dir);
  return dir;
}

// Deterministic pseudo-random bytes
inline std::vector<uint8_t> random_bytes(size_t size, uint32_t seed = 42) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<uint8_t> data(size);
  for (auto& byte : data) {
    byte = static_cast<uint8_t>(dist(gen));
  }
  return data;
}

inline std::string bytes_to_string(const std::vector<uint8_t>& data) {
  return std::string(data.begin(), data.end());
}

inline void write_test_file(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
  std::ofstream file(path, std::ios::binary);
  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::vector<uint8_t> read_test_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

#endif // NEBULA_TEST_UTILS_HPP
