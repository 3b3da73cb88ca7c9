#include "store/chunk_store.hpp"
#include "utils/durable_file.hpp"
#include <algorithm>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace nebula {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

ChunkStore::ChunkStore(const std::filesystem::path& objects_dir,
                       const std::filesystem::path& staging_dir,
                       bool verify_on_read)
  : objects_dir_(objects_dir)
  , staging_dir_(staging_dir)
  , verify_on_read_(verify_on_read) {
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Initializing with objects directory: " << objects_dir_.string();
  check_directory_exists(objects_dir_);
  check_directory_exists(staging_dir_);
  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Verification on read " << (verify_on_read_ ? "enabled" : "disabled");
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

crypto::Digest ChunkStore::put(const std::vector<uint8_t>& bytes) {
  return put(bytes.data(), bytes.size());
}

crypto::Digest ChunkStore::put(const uint8_t* data, size_t size) {
  crypto::Digest digest = crypto::Hasher::digest(data, size);
  std::string hex = crypto::Hasher::to_hex(digest);
  std::filesystem::path file_path = get_path_for_digest(digest);

  std::error_code ec;
  if (std::filesystem::exists(file_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk store: Chunk already stored, skipping write: " << hex;
    return digest;
  }
  if (ec) {
    throw IoError(file_path.string(), "Chunk store: Failed to check chunk path: " + ec.message());
  }

  std::filesystem::path shard_dir = file_path.parent_path();
  bool new_shard = check_directory_exists(shard_dir);

  // Stage the payload, then publish it with an atomic rename. Writers
  // racing on the same digest all rename identical bytes into place.
  std::filesystem::path temp_path = utils::unique_temp_path(staging_dir_, "chunk");
  try {
    utils::write_durably(temp_path, data, size);

    std::filesystem::rename(temp_path, file_path, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to publish chunk " << hex << ": " << ec.message();
      throw IoError(hex, "Chunk store: Failed to publish chunk: " + ec.message());
    }
    utils::sync_directory(shard_dir);
    if (new_shard) {
      // The shard's own entry in objects/ must survive a crash too
      utils::sync_directory(objects_dir_);
    }
  }
  catch (const StoreError&) {
    std::filesystem::remove(temp_path, ec);
    throw;
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Stored " << size << " bytes under " << hex;
  return digest;
}

std::vector<uint8_t> ChunkStore::get(const crypto::Digest& digest) const {
  std::string hex = crypto::Hasher::to_hex(digest);
  std::filesystem::path file_path = get_path_for_digest(digest);

  std::error_code ec;
  if (!std::filesystem::exists(file_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk store: Chunk not found: " << hex;
    throw NotFoundError(hex, "Chunk store: Chunk not found");
  }

  std::vector<uint8_t> data;
  try {
    data = utils::read_file(file_path);
  }
  catch (const NotFoundError&) {
    // Removed between the existence check and the read
    throw NotFoundError(hex, "Chunk store: Chunk not found");
  }

  if (verify_on_read_ && crypto::Hasher::digest(data) != digest) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Payload does not match digest: " << hex;
    throw CorruptChunkError(hex, "Chunk store: Stored payload does not match its digest");
  }

  BOOST_LOG_TRIVIAL(trace) << "Chunk store: Retrieved " << data.size() << " bytes for " << hex;
  return data;
}

bool ChunkStore::remove(const crypto::Digest& digest) {
  std::string hex = crypto::Hasher::to_hex(digest);
  std::filesystem::path file_path = get_path_for_digest(digest);

  std::error_code ec;
  bool removed = std::filesystem::remove(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to remove chunk " << hex << ": " << ec.message();
    throw IoError(hex, "Chunk store: Failed to remove chunk: " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk store: " << (removed ? "Removed chunk " : "No chunk to remove for ") << hex;
  return removed;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ChunkStore::contains(const crypto::Digest& digest) const {
  std::filesystem::path file_path = get_path_for_digest(digest);

  std::error_code ec;
  bool exists = std::filesystem::exists(file_path, ec);
  if (ec) {
    throw IoError(file_path.string(), "Chunk store: Failed to check chunk path: " + ec.message());
  }
  return exists;
}

ChunkStoreStats ChunkStore::stats() const {
  ChunkStoreStats result;
  for (const auto& info : list_chunks()) {
    ++result.chunk_count;
    result.total_unique_bytes += info.size;
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk store: " << result.chunk_count << " chunks, "
                           << result.total_unique_bytes << " unique bytes";
  return result;
}

std::vector<ChunkInfo> ChunkStore::list_chunks() const {
  std::vector<ChunkInfo> chunks;
  std::error_code ec;

  std::filesystem::recursive_directory_iterator it(objects_dir_, ec);
  if (ec) {
    throw IoError(objects_dir_.string(), "Chunk store: Failed to scan objects: " + ec.message());
  }

  for (std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      throw IoError(objects_dir_.string(), "Chunk store: Failed to scan objects: " + ec.message());
    }
    if (!it->is_regular_file(ec)) {
      continue;
    }

    // Reassemble the digest from {prefix dir}/{rest}
    const std::filesystem::path& path = it->path();
    std::string hex = path.parent_path().filename().string() + path.filename().string();

    ChunkInfo info;
    try {
      info.digest = crypto::Hasher::from_hex(hex);
    }
    catch (const InvalidInputError&) {
      BOOST_LOG_TRIVIAL(warning) << "Chunk store: Ignoring stray file in objects: " << path.string();
      continue;
    }

    info.size = it->file_size(ec);
    if (ec) {
      throw IoError(path.string(), "Chunk store: Failed to read chunk size: " + ec.message());
    }
    chunks.push_back(info);
  }

  std::sort(chunks.begin(), chunks.end(), [](const ChunkInfo& a, const ChunkInfo& b) {
    return a.digest < b.digest;
  });
  return chunks;
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path ChunkStore::get_path_for_digest(const crypto::Digest& digest) const {
  std::string hex = crypto::Hasher::to_hex(digest);
  return objects_dir_ / hex.substr(0, 2) / hex.substr(2);
}

bool ChunkStore::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  bool created = std::filesystem::create_directories(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to create directory " << path.string() << ": " << ec.message();
    throw IoError(path.string(), "Chunk store: Failed to create directory: " + ec.message());
  }
  return created;
}

} // namespace store
} // namespace nebula
