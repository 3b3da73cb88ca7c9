#include "node/node.hpp"
#include "crypto/hasher.hpp"
#include "store/store_error.hpp"
#include "utils/durable_file.hpp"
#include <fstream>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace nebula {
namespace node {

//==============================================
// CONSTRUCTOR
//==============================================

Node::Node(StorageRoot& root, const store::ChunkerConfig& chunker_config)
  : root_(root)
  , chunker_config_(chunker_config) {
  chunker_config_.validate();
  BOOST_LOG_TRIVIAL(debug) << "Node: Bound to storage root " << root_.root().string();
}


//==============================================
// PROCESSING OF USER REQUESTS
//==============================================

registry::FileId Node::put_file(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(info) << "Node: Storing file: " << path.string();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Node: Not a regular file: " << path.string();
    throw store::NotFoundError(path.string(), "Node: File does not exist or is not a regular file");
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Node: Failed to open file: " << path.string();
    throw store::IoError(path.string(), "Node: Failed to open file");
  }

  return put_stream(path.filename().string(), file);
}

registry::FileId Node::put_stream(const std::string& filename, std::istream& input) {
  store::ChunkStore& chunk_store = root_.chunk_store();
  store::Chunker chunker(input, chunker_config_);
  crypto::Hasher file_hasher;

  std::vector<crypto::Digest> digests;
  uint64_t total_size = 0;

  // Chunks written before a failure stay behind; no record refers to them
  while (auto span = chunker.next()) {
    digests.push_back(chunk_store.put(span->bytes));
    file_hasher.update(span->bytes);
    total_size += span->length;
  }

  crypto::Digest file_digest = file_hasher.finish();
  registry::FileId id = root_.file_registry().register_file(filename, total_size, digests, file_digest);

  BOOST_LOG_TRIVIAL(info) << "Node: Stored " << filename << " (" << total_size << " bytes, "
                          << digests.size() << " chunks) as " << registry::id_to_string(id);
  return id;
}

registry::FileRecord Node::get_file(const std::string& id_or_prefix, const std::filesystem::path& destination) {
  BOOST_LOG_TRIVIAL(info) << "Node: Retrieving " << id_or_prefix << " to " << destination.string();

  registry::FileRegistry& file_registry = root_.file_registry();
  registry::FileId id = file_registry.resolve_id(id_or_prefix);
  registry::FileRecord record = file_registry.lookup(id);
  std::vector<uint8_t> bytes = file_registry.reconstruct(record, root_.chunk_store());

  std::string id_text = registry::id_to_string(id);
  if (bytes.size() != record.total_size) {
    BOOST_LOG_TRIVIAL(error) << "Node: Size mismatch for " << id_text << ": got " << bytes.size()
                             << ", expected " << record.total_size;
    throw store::CorruptChunkError(id_text, "Node: Reconstructed size does not match record");
  }
  if (crypto::Hasher::digest(bytes) != record.file_digest) {
    BOOST_LOG_TRIVIAL(error) << "Node: Content digest mismatch for " << id_text;
    throw store::CorruptChunkError(id_text, "Node: Reconstructed content does not match file digest");
  }

  write_destination(destination, bytes);

  BOOST_LOG_TRIVIAL(info) << "Node: Retrieved " << record.filename << " (" << bytes.size() << " bytes) to "
                          << destination.string();
  return record;
}


//==============================================
// REPORTING
//==============================================

NodeStats Node::stats() const {
  NodeStats result;

  for (const auto& record : root_.file_registry().list()) {
    ++result.total_files;
    result.total_file_bytes += record.total_size;
  }

  store::ChunkStoreStats chunk_stats = root_.chunk_store().stats();
  result.chunk_count = chunk_stats.chunk_count;
  result.total_unique_chunk_bytes = chunk_stats.total_unique_bytes;

  if (result.total_file_bytes > 0) {
    result.dedup_ratio = 1.0 - static_cast<double>(result.total_unique_chunk_bytes)
                               / static_cast<double>(result.total_file_bytes);
  }

  BOOST_LOG_TRIVIAL(debug) << "Node: " << result.total_files << " files, " << result.total_file_bytes
                           << " logical bytes, " << result.total_unique_chunk_bytes << " unique bytes";
  return result;
}

std::vector<registry::FileRecord> Node::list_files(const std::string& filter) const {
  return root_.file_registry().list(filter);
}


//==============================================
// DESTINATION OUTPUT
//==============================================

void Node::write_destination(const std::filesystem::path& destination, const std::vector<uint8_t>& bytes) const {
  std::filesystem::path parent = destination.parent_path();
  if (parent.empty()) {
    parent = std::filesystem::current_path();
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(parent, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Node: Destination directory does not exist: " << parent.string();
    throw store::IoError(destination.string(), "Node: Destination directory does not exist");
  }

  std::filesystem::path temp_path = utils::unique_temp_path(parent, "." + destination.filename().string() + ".partial");
  try {
    utils::write_durably(temp_path, bytes.data(), bytes.size());
    std::filesystem::rename(temp_path, destination, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Node: Failed to move output into place: " << ec.message();
      throw store::IoError(destination.string(), "Node: Failed to write destination: " + ec.message());
    }
  }
  catch (const store::StoreError&) {
    std::filesystem::remove(temp_path, ec);
    throw;
  }
}

} // namespace node
} // namespace nebula
