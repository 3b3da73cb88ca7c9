#include "registry/record_codec.hpp"
#include "store/store_error.hpp"
#include <algorithm>
#include <cstring>
#include <sstream>
#include <boost/log/trivial.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace nebula {
namespace registry {

namespace {

constexpr uint32_t MAX_FILENAME_LENGTH = 64 * 1024;

} // namespace


//==============================================
// IDENTIFIER FORMATTING
//==============================================

std::string id_to_string(const FileId& id) {
  return boost::uuids::to_string(id);
}

std::string id_to_hex(const FileId& id) {
  std::string text = boost::uuids::to_string(id);
  text.erase(std::remove(text.begin(), text.end(), '-'), text.end());
  return text;
}

std::string short_id(const FileId& id) {
  return id_to_hex(id).substr(0, crypto::SHORT_HEX_LENGTH);
}


//==============================================
// SERIALIZATION
//==============================================

std::size_t RecordCodec::serialize(const FileRecord& record, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Invalid output stream state";
    throw store::IoError(id_to_string(record.id), "Record codec: Invalid output stream");
  }

  if (record.filename.size() > MAX_FILENAME_LENGTH) {
    throw store::InvalidInputError(record.filename.substr(0, 64), "Record codec: Filename too long");
  }

  std::size_t total_bytes = 0;

  write_bytes(output, MAGIC, sizeof(MAGIC));
  total_bytes += sizeof(MAGIC);

  write_bytes(output, &VERSION, sizeof(VERSION));
  total_bytes += sizeof(VERSION);

  write_bytes(output, record.id.data, record.id.size());
  total_bytes += record.id.size();

  uint32_t network_name_length = to_network_order(static_cast<uint32_t>(record.filename.size()));
  write_bytes(output, &network_name_length, sizeof(network_name_length));
  write_bytes(output, record.filename.data(), record.filename.size());
  total_bytes += sizeof(network_name_length) + record.filename.size();

  uint64_t network_total_size = to_network_order(record.total_size);
  write_bytes(output, &network_total_size, sizeof(network_total_size));
  total_bytes += sizeof(network_total_size);

  uint64_t network_created_at = to_network_order(record.created_at);
  write_bytes(output, &network_created_at, sizeof(network_created_at));
  total_bytes += sizeof(network_created_at);

  write_bytes(output, record.file_digest.data(), record.file_digest.size());
  total_bytes += record.file_digest.size();

  uint32_t network_chunk_count = to_network_order(static_cast<uint32_t>(record.chunks.size()));
  write_bytes(output, &network_chunk_count, sizeof(network_chunk_count));
  total_bytes += sizeof(network_chunk_count);

  for (const auto& digest : record.chunks) {
    write_bytes(output, digest.data(), digest.size());
    total_bytes += digest.size();
  }

  BOOST_LOG_TRIVIAL(debug) << "Record codec: Serialized record " << id_to_string(record.id)
                           << " with " << record.chunks.size() << " chunks (" << total_bytes << " bytes)";
  return total_bytes;
}

FileRecord RecordCodec::deserialize(std::istream& input) {
  FileRecord record;

  char magic[sizeof(MAGIC)];
  read_bytes(input, magic, sizeof(magic));
  if (std::memcmp(magic, MAGIC, sizeof(MAGIC)) != 0) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Bad record magic";
    throw store::InvalidInputError("Record codec: Not a file record");
  }

  uint8_t version = 0;
  read_bytes(input, &version, sizeof(version));
  if (version != VERSION) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Unsupported record version: " << static_cast<int>(version);
    throw store::InvalidInputError("Record codec: Unsupported record version " + std::to_string(version));
  }

  read_bytes(input, record.id.data, record.id.size());

  uint32_t network_name_length = 0;
  read_bytes(input, &network_name_length, sizeof(network_name_length));
  uint32_t name_length = from_network_order(network_name_length);
  if (name_length > MAX_FILENAME_LENGTH) {
    throw store::InvalidInputError(id_to_string(record.id), "Record codec: Filename length out of range");
  }
  record.filename.resize(name_length);
  if (name_length > 0) {
    read_bytes(input, &record.filename[0], name_length);
  }

  uint64_t network_total_size = 0;
  read_bytes(input, &network_total_size, sizeof(network_total_size));
  record.total_size = from_network_order(network_total_size);

  uint64_t network_created_at = 0;
  read_bytes(input, &network_created_at, sizeof(network_created_at));
  record.created_at = from_network_order(network_created_at);

  read_bytes(input, record.file_digest.data(), record.file_digest.size());

  uint32_t network_chunk_count = 0;
  read_bytes(input, &network_chunk_count, sizeof(network_chunk_count));
  uint32_t chunk_count = from_network_order(network_chunk_count);

  // Grow as digests arrive; a corrupt count must not force a huge allocation
  record.chunks.reserve(std::min<uint32_t>(chunk_count, 4096));
  for (uint32_t i = 0; i < chunk_count; ++i) {
    crypto::Digest digest;
    read_bytes(input, digest.data(), digest.size());
    record.chunks.push_back(digest);
  }

  BOOST_LOG_TRIVIAL(trace) << "Record codec: Deserialized record " << id_to_string(record.id);
  return record;
}

std::vector<uint8_t> RecordCodec::encode(const FileRecord& record) {
  std::stringstream output;
  serialize(record, output);
  std::string bytes = output.str();
  return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

FileRecord RecordCodec::decode(const std::vector<uint8_t>& data) {
  std::stringstream input(std::string(data.begin(), data.end()));
  FileRecord record = deserialize(input);

  if (input.peek() != std::char_traits<char>::eof()) {
    throw store::InvalidInputError(id_to_string(record.id), "Record codec: Trailing bytes after record");
  }
  return record;
}


//==============================================
// STREAM OPERATIONS
//==============================================

void RecordCodec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Failed to write " << size << " bytes to output stream";
    throw store::IoError("", "Record codec: Failed to write to output stream");
  }
}

void RecordCodec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Failed to read " << size << " bytes from input stream";
    throw store::InvalidInputError("Record codec: Truncated record");
  }
}

} // namespace registry
} // namespace nebula
