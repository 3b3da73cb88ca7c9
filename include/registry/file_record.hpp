#ifndef NEBULA_REGISTRY_FILE_RECORD_HPP
#define NEBULA_REGISTRY_FILE_RECORD_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <boost/uuid/uuid.hpp>
#include "crypto/hasher.hpp"

namespace nebula {
namespace registry {

using FileId = boost::uuids::uuid;

// One stored file. chunks is ordered: concatenating the chunks in this
// order reproduces the original total_size bytes.
struct FileRecord {
  FileId id{};
  std::string filename;
  uint64_t total_size = 0;
  uint64_t created_at = 0;  // Unix seconds
  crypto::Digest file_digest{};
  std::vector<crypto::Digest> chunks;
};

// Hyphenated textual form, e.g. 1b4e28ba-2fa1-11d2-883f-0016d3cca427
std::string id_to_string(const FileId& id);
// 32 lowercase hex characters without hyphens; prefixes match against this
std::string id_to_hex(const FileId& id);
// First 8 characters of the hex form
std::string short_id(const FileId& id);

} // namespace registry
} // namespace nebula

#endif // NEBULA_REGISTRY_FILE_RECORD_HPP
