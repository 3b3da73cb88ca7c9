#include "utils/durable_file.hpp"
#include "store/store_error.hpp"
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <random>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace nebula {
namespace utils {

namespace {

std::string errno_message(const std::string& what) {
  return what + ": " + std::strerror(errno);
}

// Closes the descriptor on every exit path
struct FileDescriptor {
  int fd = -1;

  explicit FileDescriptor(int descriptor) : fd(descriptor) {}

  ~FileDescriptor() {
    if (fd >= 0) {
      ::close(fd);
    }
  }

  int release() {
    int result = fd;
    fd = -1;
    return result;
  }
};

} // namespace


//==============================================
// ATOMIC PUBLICATION SUPPORT
//==============================================

std::filesystem::path unique_temp_path(const std::filesystem::path& dir, const std::string& prefix) {
  static std::atomic<uint64_t> counter{0};
  thread_local std::mt19937_64 gen{std::random_device{}()};

  std::stringstream name;
  name << prefix << "_" << ::getpid() << "_" << std::hex << gen() << "_" << counter.fetch_add(1);
  return dir / name.str();
}

void write_durably(const std::filesystem::path& file_path, const uint8_t* data, size_t size) {
  FileDescriptor file(::open(file_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
  if (file.fd < 0) {
    BOOST_LOG_TRIVIAL(error) << "Durable file: Failed to create " << file_path.string() << ": " << std::strerror(errno);
    throw store::IoError(file_path.string(), errno_message("Failed to create file"));
  }

  size_t written = 0;
  while (written < size) {
    ssize_t result = ::write(file.fd, data + written, size - written);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      BOOST_LOG_TRIVIAL(error) << "Durable file: Write failed for " << file_path.string() << ": " << std::strerror(errno);
      throw store::IoError(file_path.string(), errno_message("Failed to write file"));
    }
    written += static_cast<size_t>(result);
  }

  if (::fsync(file.fd) != 0) {
    BOOST_LOG_TRIVIAL(error) << "Durable file: fsync failed for " << file_path.string() << ": " << std::strerror(errno);
    throw store::IoError(file_path.string(), errno_message("Failed to sync file"));
  }

  if (::close(file.release()) != 0) {
    throw store::IoError(file_path.string(), errno_message("Failed to close file"));
  }
}

void sync_directory(const std::filesystem::path& dir) {
  FileDescriptor handle(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (handle.fd < 0) {
    throw store::IoError(dir.string(), errno_message("Failed to open directory"));
  }
  if (::fsync(handle.fd) != 0) {
    throw store::IoError(dir.string(), errno_message("Failed to sync directory"));
  }
}


//==============================================
// READ SUPPORT
//==============================================

std::vector<uint8_t> read_file(const std::filesystem::path& file_path) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
      throw store::NotFoundError(file_path.string(), "File not found");
    }
    throw store::IoError(file_path.string(), "Failed to open file");
  }

  std::vector<uint8_t> data;
  char buffer[4096];

  // Read file in chunks to handle large files efficiently
  while (file.read(buffer, sizeof(buffer))) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }
  // Handle final partial chunk if any
  if (file.gcount() > 0) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }

  if (file.bad()) {
    throw store::IoError(file_path.string(), "Failed to read file");
  }
  return data;
}

} // namespace utils
} // namespace nebula
