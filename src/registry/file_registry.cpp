#include "registry/file_registry.hpp"
#include "registry/record_codec.hpp"
#include "utils/durable_file.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <system_error>
#include <boost/log/trivial.hpp>
#include <boost/uuid/random_generator.hpp>

namespace nebula {
namespace registry {

namespace {

const char* RECORD_EXTENSION = ".rec";
constexpr int MAX_ID_ATTEMPTS = 8;

bool is_hex_string(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

// Lowercase and drop hyphens so "1B4E28BA-2FA1" and "1b4e28ba2fa1" compare equal
std::string normalize_id_text(const std::string& text) {
  std::string result;
  result.reserve(text.size());
  for (unsigned char c : text) {
    if (c != '-') {
      result.push_back(static_cast<char>(std::tolower(c)));
    }
  }
  return result;
}

uint64_t unix_now() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace


//==============================================
// CONSTRUCTOR
//==============================================

FileRegistry::FileRegistry(const std::filesystem::path& records_dir, const std::filesystem::path& staging_dir)
  : records_dir_(records_dir)
  , staging_dir_(staging_dir) {
  BOOST_LOG_TRIVIAL(info) << "File registry: Initializing with records directory: " << records_dir_.string();

  for (const auto& dir : {records_dir_, staging_dir_}) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "File registry: Failed to create directory " << dir.string() << ": " << ec.message();
      throw store::IoError(dir.string(), "File registry: Failed to create directory: " + ec.message());
    }
  }
}


//==============================================
// REGISTRATION
//==============================================

FileId FileRegistry::register_file(const std::string& filename,
                                   uint64_t total_size,
                                   const std::vector<crypto::Digest>& chunks,
                                   const crypto::Digest& file_digest) {
  FileRecord record;
  record.filename = filename;
  record.total_size = total_size;
  record.created_at = unix_now();
  record.file_digest = file_digest;
  record.chunks = chunks;

  for (int attempt = 0; attempt < MAX_ID_ATTEMPTS; ++attempt) {
    record.id = generate_id();
    if (publish(record)) {
      BOOST_LOG_TRIVIAL(info) << "File registry: Registered " << filename << " as " << id_to_string(record.id)
                              << " (" << total_size << " bytes, " << chunks.size() << " chunks)";
      return record.id;
    }
    BOOST_LOG_TRIVIAL(warning) << "File registry: Id collision on " << id_to_string(record.id) << ", drawing a new id";
  }

  throw store::IoError(filename, "File registry: Could not allocate a unique file id");
}

void FileRegistry::register_record(const FileRecord& record) {
  if (!publish(record)) {
    BOOST_LOG_TRIVIAL(error) << "File registry: Record already registered: " << id_to_string(record.id);
    throw store::InvalidInputError(id_to_string(record.id), "File registry: File id already registered");
  }
  BOOST_LOG_TRIVIAL(info) << "File registry: Registered record " << id_to_string(record.id)
                          << " for " << record.filename;
}

bool FileRegistry::remove(const FileId& id) {
  std::filesystem::path record_path = get_path_for_id(id);

  std::error_code ec;
  bool removed = std::filesystem::remove(record_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "File registry: Failed to remove record " << id_to_string(id) << ": " << ec.message();
    throw store::IoError(id_to_string(id), "File registry: Failed to remove record: " + ec.message());
  }
  if (removed) {
    utils::sync_directory(records_dir_);
  }

  BOOST_LOG_TRIVIAL(info) << "File registry: " << (removed ? "Removed record " : "No record to remove for ")
                          << id_to_string(id);
  return removed;
}


//==============================================
// LOOKUP
//==============================================

ResolveResult FileRegistry::resolve(const std::string& id_or_prefix) const {
  std::string prefix = normalize_id_text(id_or_prefix);
  if (prefix.empty()) {
    throw store::InvalidInputError(id_or_prefix, "File registry: Empty file id");
  }

  ResolveResult result;

  // Non-hex or over-long input cannot match any id
  if (prefix.size() > 32 || !is_hex_string(prefix)) {
    BOOST_LOG_TRIVIAL(debug) << "File registry: Not a valid id or prefix: " << id_or_prefix;
    return result;
  }

  for (const auto& hex : scan_record_ids()) {
    if (hex.compare(0, prefix.size(), prefix) == 0) {
      result.candidates.push_back(parse_hex_id(hex));
    }
  }
  std::sort(result.candidates.begin(), result.candidates.end());

  if (result.candidates.size() == 1) {
    result.status = ResolveStatus::RESOLVED;
    result.id = result.candidates.front();
  } else if (result.candidates.size() > 1) {
    result.status = ResolveStatus::AMBIGUOUS;
  }

  BOOST_LOG_TRIVIAL(debug) << "File registry: Prefix " << id_or_prefix << " matched "
                           << result.candidates.size() << " records";
  return result;
}

FileId FileRegistry::resolve_id(const std::string& id_or_prefix) const {
  ResolveResult result = resolve(id_or_prefix);

  switch (result.status) {
    case ResolveStatus::RESOLVED:
      return result.id;
    case ResolveStatus::AMBIGUOUS:
      throw store::AmbiguousIdError(id_or_prefix, "File registry: Prefix matches "
                                    + std::to_string(result.candidates.size()) + " files");
    case ResolveStatus::NOT_FOUND:
    default:
      throw store::NotFoundError(id_or_prefix, "File registry: No file matches id");
  }
}

FileRecord FileRegistry::lookup(const FileId& id) const {
  std::filesystem::path record_path = get_path_for_id(id);

  std::error_code ec;
  if (!std::filesystem::exists(record_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "File registry: Record not found: " << id_to_string(id);
    throw store::NotFoundError(id_to_string(id), "File registry: File not found");
  }

  try {
    return read_record(record_path);
  }
  catch (const store::NotFoundError&) {
    // Removed between the existence check and the read
    throw store::NotFoundError(id_to_string(id), "File registry: File not found");
  }
}


//==============================================
// RECONSTRUCTION
//==============================================

std::vector<uint8_t> FileRegistry::reconstruct(const FileId& id, const store::ChunkStore& chunk_store) const {
  return reconstruct(lookup(id), chunk_store);
}

std::vector<uint8_t> FileRegistry::reconstruct(const FileRecord& record, const store::ChunkStore& chunk_store) const {
  std::string id_text = id_to_string(record.id);

  BOOST_LOG_TRIVIAL(info) << "File registry: Reconstructing " << id_text << " from " << record.chunks.size() << " chunks";

  std::vector<uint8_t> output;
  output.reserve(static_cast<size_t>(record.total_size));

  for (size_t i = 0; i < record.chunks.size(); ++i) {
    const crypto::Digest& digest = record.chunks[i];
    std::vector<uint8_t> chunk;
    try {
      chunk = chunk_store.get(digest);
    }
    catch (const store::NotFoundError&) {
      std::string hex = crypto::Hasher::to_hex(digest);
      BOOST_LOG_TRIVIAL(error) << "File registry: File " << id_text << " references missing chunk "
                               << hex << " at position " << i;
      throw store::CorruptChunkError(hex, "File registry: File " + id_text + " references a missing chunk");
    }
    output.insert(output.end(), chunk.begin(), chunk.end());
  }

  if (output.size() != record.total_size) {
    BOOST_LOG_TRIVIAL(error) << "File registry: Reconstructed " << output.size() << " bytes for " << id_text
                             << ", record says " << record.total_size;
    throw store::CorruptChunkError(id_text, "File registry: Reconstructed size does not match record");
  }

  BOOST_LOG_TRIVIAL(info) << "File registry: Reconstructed " << output.size() << " bytes for " << id_text;
  return output;
}


//==============================================
// ENUMERATION
//==============================================

std::vector<FileRecord> FileRegistry::list(const std::string& filter) const {
  std::vector<FileRecord> records;

  for (const auto& hex : scan_record_ids()) {
    FileRecord record;
    try {
      record = read_record(records_dir_ / (hex + RECORD_EXTENSION));
    }
    catch (const store::NotFoundError&) {
      // Removed while listing
      continue;
    }
    if (filter.empty() || record.filename.find(filter) != std::string::npos) {
      records.push_back(std::move(record));
    }
  }

  std::sort(records.begin(), records.end(), [](const FileRecord& a, const FileRecord& b) {
    if (a.created_at != b.created_at) {
      return a.created_at < b.created_at;
    }
    return a.id < b.id;
  });
  return records;
}

size_t FileRegistry::count() const {
  return scan_record_ids().size();
}

uint64_t FileRegistry::total_size() const {
  uint64_t total = 0;
  for (const auto& record : list()) {
    total += record.total_size;
  }
  return total;
}


//==============================================
// RECORD FILES
//==============================================

std::filesystem::path FileRegistry::get_path_for_id(const FileId& id) const {
  return records_dir_ / (id_to_hex(id) + RECORD_EXTENSION);
}

std::vector<std::string> FileRegistry::scan_record_ids() const {
  std::vector<std::string> ids;
  std::error_code ec;

  std::filesystem::directory_iterator it(records_dir_, ec);
  if (ec) {
    throw store::IoError(records_dir_.string(), "File registry: Failed to scan records: " + ec.message());
  }

  for (std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      throw store::IoError(records_dir_.string(), "File registry: Failed to scan records: " + ec.message());
    }
    const std::filesystem::path& path = it->path();
    if (path.extension() != RECORD_EXTENSION) {
      continue;
    }
    std::string stem = path.stem().string();
    if (stem.size() == 32 && is_hex_string(stem)) {
      ids.push_back(stem);
    }
  }
  return ids;
}

FileRecord FileRegistry::read_record(const std::filesystem::path& record_path) const {
  std::vector<uint8_t> data = utils::read_file(record_path);

  FileRecord record;
  try {
    record = RecordCodec::decode(data);
  }
  catch (const store::InvalidInputError& e) {
    BOOST_LOG_TRIVIAL(error) << "File registry: Corrupted record " << record_path.string() << ": " << e.what();
    throw store::IoError(record_path.string(), "File registry: Corrupted record");
  }

  if (record_path.stem().string() != id_to_hex(record.id)) {
    BOOST_LOG_TRIVIAL(error) << "File registry: Record id does not match its file name: " << record_path.string();
    throw store::IoError(record_path.string(), "File registry: Record id does not match its file name");
  }
  return record;
}

bool FileRegistry::publish(const FileRecord& record) {
  std::vector<uint8_t> encoded = RecordCodec::encode(record);
  std::filesystem::path record_path = get_path_for_id(record.id);
  std::filesystem::path temp_path = utils::unique_temp_path(staging_dir_, "record");

  std::error_code ec;
  try {
    utils::write_durably(temp_path, encoded.data(), encoded.size());

    // A hard link fails if the target exists, so a fully written record
    // appears under its id exactly once
    std::filesystem::create_hard_link(temp_path, record_path, ec);
    if (ec == std::errc::file_exists) {
      std::filesystem::remove(temp_path, ec);
      return false;
    }
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "File registry: Failed to publish record " << id_to_string(record.id)
                               << ": " << ec.message();
      throw store::IoError(id_to_string(record.id), "File registry: Failed to publish record: " + ec.message());
    }
    utils::sync_directory(records_dir_);
  }
  catch (const store::StoreError&) {
    std::filesystem::remove(temp_path, ec);
    throw;
  }

  std::filesystem::remove(temp_path, ec);
  return true;
}

FileId FileRegistry::generate_id() {
  thread_local boost::uuids::random_generator generator;
  return generator();
}

FileId FileRegistry::parse_hex_id(const std::string& hex) {
  FileId id{};
  for (size_t i = 0; i < id.size(); ++i) {
    id.data[i] = static_cast<uint8_t>(std::stoul(hex.substr(2 * i, 2), nullptr, 16));
  }
  return id;
}

} // namespace registry
} // namespace nebula
