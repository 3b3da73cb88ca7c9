#include "node/storage_root.hpp"
#include "utils/durable_file.hpp"
#include <system_error>
#include <boost/log/trivial.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace nebula {
namespace node {

namespace {

std::string trim(const std::string& text) {
  size_t begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

StorageRoot::StorageRoot(const std::filesystem::path& root_dir, bool verify_on_read)
  : root_dir_(root_dir) {
  BOOST_LOG_TRIVIAL(info) << "Storage root: Opening storage root at: " << root_dir_.string();

  bool new_root = check_directory_exists(root_dir_);
  bool new_layout = check_directory_exists(root_dir_ / "tmp");
  new_layout |= check_directory_exists(root_dir_ / "objects");
  new_layout |= check_directory_exists(root_dir_ / "files");
  check_layout_version();
  load_or_create_node_id();

  chunk_store_ = std::make_unique<store::ChunkStore>(root_dir_ / "objects", root_dir_ / "tmp", verify_on_read);
  file_registry_ = std::make_unique<registry::FileRegistry>(root_dir_ / "files", root_dir_ / "tmp");

  // Make the freshly created layout directories durable
  if (new_layout) {
    utils::sync_directory(root_dir_);
  }
  if (new_root && root_dir_.has_parent_path()) {
    utils::sync_directory(root_dir_.parent_path());
  }
  open_ = true;

  BOOST_LOG_TRIVIAL(info) << "Storage root: Node " << node_id_ << " ready at " << root_dir_.string();
}

StorageRoot::~StorageRoot() {
  shutdown();
}


//==============================================
// LIFECYCLE
//==============================================

void StorageRoot::shutdown() {
  if (!open_) {
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "Storage root: Shutting down node " << node_id_;
  file_registry_.reset();
  chunk_store_.reset();
  open_ = false;
}


//==============================================
// GETTERS
//==============================================

store::ChunkStore& StorageRoot::chunk_store() {
  ensure_open();
  return *chunk_store_;
}

const store::ChunkStore& StorageRoot::chunk_store() const {
  ensure_open();
  return *chunk_store_;
}

registry::FileRegistry& StorageRoot::file_registry() {
  ensure_open();
  return *file_registry_;
}

const registry::FileRegistry& StorageRoot::file_registry() const {
  ensure_open();
  return *file_registry_;
}

void StorageRoot::ensure_open() const {
  if (!open_) {
    throw store::IoError(root_dir_.string(), "Storage root: Storage root is shut down");
  }
}


//==============================================
// INITIALIZATION
//==============================================

bool StorageRoot::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  bool created = std::filesystem::create_directories(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Storage root: Failed to create directory " << path.string() << ": " << ec.message();
    throw store::IoError(path.string(), "Storage root: Failed to create directory: " + ec.message());
  }
  return created;
}

void StorageRoot::check_layout_version() {
  std::string version = publish_once(root_dir_ / "VERSION", std::string(LAYOUT_VERSION) + "\n");
  if (trim(version) != LAYOUT_VERSION) {
    BOOST_LOG_TRIVIAL(error) << "Storage root: Unsupported layout '" << trim(version) << "' at " << root_dir_.string();
    throw store::InvalidInputError(root_dir_.string(), "Storage root: Unsupported storage layout: " + trim(version));
  }
}

void StorageRoot::load_or_create_node_id() {
  boost::uuids::random_generator generator;
  std::string fresh_id = boost::uuids::to_string(generator());

  node_id_ = trim(publish_once(root_dir_ / "node.id", fresh_id + "\n"));
  if (node_id_.empty()) {
    throw store::IoError((root_dir_ / "node.id").string(), "Storage root: Empty node id");
  }
  BOOST_LOG_TRIVIAL(debug) << "Storage root: Node id " << node_id_ << (node_id_ == fresh_id ? " (new)" : " (existing)");
}

std::string StorageRoot::publish_once(const std::filesystem::path& path, const std::string& content) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    std::filesystem::path temp_path = utils::unique_temp_path(root_dir_ / "tmp", path.filename().string());
    try {
      utils::write_durably(temp_path, reinterpret_cast<const uint8_t*>(content.data()), content.size());

      // Two nodes starting on a fresh root race here; the first link wins
      std::filesystem::create_hard_link(temp_path, path, ec);
      if (ec && ec != std::errc::file_exists) {
        throw store::IoError(path.string(), "Storage root: Failed to create file: " + ec.message());
      }
    }
    catch (const store::StoreError&) {
      std::filesystem::remove(temp_path, ec);
      throw;
    }
    std::filesystem::remove(temp_path, ec);
    utils::sync_directory(root_dir_);
  }

  std::vector<uint8_t> data = utils::read_file(path);
  return std::string(data.begin(), data.end());
}

} // namespace node
} // namespace nebula
