#ifndef NEBULA_REGISTRY_FILE_REGISTRY_HPP
#define NEBULA_REGISTRY_FILE_REGISTRY_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "registry/file_record.hpp"
#include "store/chunk_store.hpp"
#include "store/store_error.hpp"

namespace nebula {
namespace registry {

enum class ResolveStatus {
  RESOLVED,
  AMBIGUOUS,
  NOT_FOUND
};

struct ResolveResult {
  ResolveStatus status = ResolveStatus::NOT_FOUND;
  FileId id{};                    // set when RESOLVED
  std::vector<FileId> candidates; // every match, sorted

  bool resolved() const { return status == ResolveStatus::RESOLVED; }
};

// Persistent index of file records, one record file per id. Readers never
// observe a partially written record. Nothing is cached in memory, so any
// number of threads or processes may share one records directory.
class FileRegistry {
public:
  // ---- CONSTRUCTOR ----
  FileRegistry(const std::filesystem::path& records_dir, const std::filesystem::path& staging_dir);


  // ---- REGISTRATION ----
  // Allocates a fresh id and publishes the record atomically
  FileId register_file(const std::string& filename,
                       uint64_t total_size,
                       const std::vector<crypto::Digest>& chunks,
                       const crypto::Digest& file_digest);
  // Publishes a record built elsewhere, keeping its id. Throws
  // InvalidInputError if the id is already registered.
  void register_record(const FileRecord& record);
  // Explicit delete. Chunks are left in place.
  bool remove(const FileId& id);


  // ---- LOOKUP ----
  // Accepts a full id (with or without hyphens) or any hex prefix of it
  ResolveResult resolve(const std::string& id_or_prefix) const;
  // Throwing form of resolve: AmbiguousIdError or NotFoundError
  FileId resolve_id(const std::string& id_or_prefix) const;
  FileRecord lookup(const FileId& id) const;


  // ---- RECONSTRUCTION ----
  // Concatenates the record's chunks in order. A missing chunk raises
  // CorruptChunkError and nothing is returned.
  std::vector<uint8_t> reconstruct(const FileId& id, const store::ChunkStore& chunk_store) const;
  // Same, for a record the caller already looked up
  std::vector<uint8_t> reconstruct(const FileRecord& record, const store::ChunkStore& chunk_store) const;


  // ---- ENUMERATION ----
  // Records whose filename contains filter (all when empty), oldest first
  std::vector<FileRecord> list(const std::string& filter = "") const;
  size_t count() const;
  uint64_t total_size() const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path records_dir_;
  std::filesystem::path staging_dir_;


  // ---- RECORD FILES ----
  std::filesystem::path get_path_for_id(const FileId& id) const;
  // Hex ids of every record file present
  std::vector<std::string> scan_record_ids() const;
  FileRecord read_record(const std::filesystem::path& record_path) const;
  // Returns false if a record with the same id already exists
  bool publish(const FileRecord& record);
  static FileId generate_id();
  static FileId parse_hex_id(const std::string& hex);
};

} // namespace registry
} // namespace nebula

#endif // NEBULA_REGISTRY_FILE_REGISTRY_HPP
