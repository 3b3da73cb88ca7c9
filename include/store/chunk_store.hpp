#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "crypto/hasher.hpp"
#include "store/store_error.hpp"

namespace nebula {
namespace store {

struct ChunkStoreStats {
  uint64_t chunk_count = 0;
  uint64_t total_unique_bytes = 0;
};

struct ChunkInfo {
  crypto::Digest digest;
  uint64_t size = 0;
};

class ChunkStore {
public:

  // ---- CONSTRUCTOR ----
  // objects_dir holds the payloads, staging_dir the in-flight writes.
  // Both must be on the same filesystem.
  ChunkStore(const std::filesystem::path& objects_dir,
             const std::filesystem::path& staging_dir,
             bool verify_on_read = true);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores bytes under their digest unless already present; durable on return
  crypto::Digest put(const std::vector<uint8_t>& bytes);
  crypto::Digest put(const uint8_t* data, size_t size);
  // Retrieves chunk bytes; throws NotFoundError, or CorruptChunkError when
  // verification is enabled and the payload no longer matches its digest
  std::vector<uint8_t> get(const crypto::Digest& digest) const;
  // Removes a chunk explicitly. Returns false if it was not stored.
  bool remove(const crypto::Digest& digest);


  // ---- QUERY OPERATIONS ----
  bool contains(const crypto::Digest& digest) const;
  ChunkStoreStats stats() const;
  // Every stored chunk, ordered by digest
  std::vector<ChunkInfo> list_chunks() const;

  const std::filesystem::path& objects_dir() const { return objects_dir_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path objects_dir_;
  std::filesystem::path staging_dir_;
  bool verify_on_read_;


  // ---- CAS STORAGE SUPPORT ----
  // {objects_dir}/{hex[0:2]}/{hex[2:]}
  std::filesystem::path get_path_for_digest(const crypto::Digest& digest) const;
  // Ensures directory exists, create if needed
  // Returns true if the directory had to be created
  bool check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace nebula
