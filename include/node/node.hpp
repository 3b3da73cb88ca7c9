#ifndef NEBULA_NODE_NODE_HPP
#define NEBULA_NODE_NODE_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>
#include "node/storage_root.hpp"
#include "store/chunker.hpp"
#include "registry/file_record.hpp"

namespace nebula {
namespace node {

struct NodeStats {
  uint64_t total_files = 0;
  uint64_t total_file_bytes = 0;
  uint64_t total_unique_chunk_bytes = 0;
  uint64_t chunk_count = 0;
  // Fraction of logical bytes not stored thanks to deduplication
  double dedup_ratio = 0.0;
};

// Ingest and retrieval on top of a StorageRoot. Holds no state of its
// own beyond the chunk profile, so several Nodes may share one root.
class Node {
public:
  // ---- CONSTRUCTOR ----
  explicit Node(StorageRoot& root, const store::ChunkerConfig& chunker_config = store::ChunkerConfig());


  // ---- PROCESSING OF USER REQUESTS ----
  // Chunks and stores a file. No record exists unless this returns.
  registry::FileId put_file(const std::filesystem::path& path);
  registry::FileId put_stream(const std::string& filename, std::istream& input);
  // Writes the file to destination after checking its size and digest.
  // On failure destination is left untouched.
  registry::FileRecord get_file(const std::string& id_or_prefix, const std::filesystem::path& destination);


  // ---- REPORTING ----
  NodeStats stats() const;
  std::vector<registry::FileRecord> list_files(const std::string& filter = "") const;


  // ---- GETTERS ----
  StorageRoot& root() { return root_; }
  const store::ChunkerConfig& chunker_config() const { return chunker_config_; }

private:
  // ---- PARAMETERS ----
  StorageRoot& root_;
  store::ChunkerConfig chunker_config_;


  // Writes bytes to a staging file beside destination, then renames it in
  void write_destination(const std::filesystem::path& destination, const std::vector<uint8_t>& bytes) const;
};

} // namespace node
} // namespace nebula

#endif // NEBULA_NODE_NODE_HPP
