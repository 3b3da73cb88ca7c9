#ifndef NEBULA_NODE_STORAGE_ROOT_HPP
#define NEBULA_NODE_STORAGE_ROOT_HPP

#include <filesystem>
#include <memory>
#include <string>
#include "store/chunk_store.hpp"
#include "registry/file_registry.hpp"

namespace nebula {
namespace node {

// On-disk root of one node. Owns the chunk store and the file registry;
// neither outlives it. Opening an existing root reuses it unchanged.
//
//   <root>/VERSION     layout marker
//   <root>/node.id     node identity, created on first start
//   <root>/objects/    chunk payloads
//   <root>/files/      file records
//   <root>/tmp/        staging for atomic writes
class StorageRoot {
public:
  static constexpr const char* LAYOUT_VERSION = "nebula-store 1";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit StorageRoot(const std::filesystem::path& root_dir, bool verify_on_read = true);
  ~StorageRoot();

  StorageRoot(const StorageRoot&) = delete;
  StorageRoot& operator=(const StorageRoot&) = delete;


  // ---- LIFECYCLE ----
  // Releases the chunk store and registry; later access throws IoError
  void shutdown();
  bool is_open() const { return open_; }


  // ---- GETTERS ----
  const std::filesystem::path& root() const { return root_dir_; }
  const std::string& node_id() const { return node_id_; }
  store::ChunkStore& chunk_store();
  const store::ChunkStore& chunk_store() const;
  registry::FileRegistry& file_registry();
  const registry::FileRegistry& file_registry() const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_dir_;
  std::string node_id_;
  bool open_ = false;
  std::unique_ptr<store::ChunkStore> chunk_store_;
  std::unique_ptr<registry::FileRegistry> file_registry_;


  // ---- INITIALIZATION ----
  // Returns true if the directory had to be created
  bool check_directory_exists(const std::filesystem::path& path) const;
  void check_layout_version();
  void load_or_create_node_id();
  // Publishes content at path unless a file is already there; returns what the file holds afterwards
  std::string publish_once(const std::filesystem::path& path, const std::string& content);
  void ensure_open() const;
};

} // namespace node
} // namespace nebula

#endif // NEBULA_NODE_STORAGE_ROOT_HPP
