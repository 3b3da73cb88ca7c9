#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace nebula {
namespace utils {

// ---- ATOMIC PUBLICATION SUPPORT ----
// Returns a path inside dir that no other thread or process will pick
std::filesystem::path unique_temp_path(const std::filesystem::path& dir, const std::string& prefix);
// Creates file_path exclusively, writes data and fsyncs it before returning
void write_durably(const std::filesystem::path& file_path, const uint8_t* data, size_t size);
// Fsyncs a directory so a rename or link inside it survives a crash
void sync_directory(const std::filesystem::path& dir);


// ---- READ SUPPORT ----
// Reads a whole file; throws store::NotFoundError if missing, store::IoError otherwise
std::vector<uint8_t> read_file(const std::filesystem::path& file_path);

} // namespace utils
} // namespace nebula
