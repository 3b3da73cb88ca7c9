#ifndef NEBULA_REGISTRY_RECORD_CODEC_HPP
#define NEBULA_REGISTRY_RECORD_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <vector>
#include <boost/endian/conversion.hpp>
#include "registry/file_record.hpp"

namespace nebula {
namespace registry {

// Binary encoding of a FileRecord, all integers big-endian:
// magic "NBFR" | version u8 | id 16 | name u32+bytes | size u64 |
// created u64 | file digest 32 | chunk count u32 | chunk digests 32 each
class RecordCodec {
public:
  static constexpr char MAGIC[4] = {'N', 'B', 'F', 'R'};
  static constexpr uint8_t VERSION = 1;


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a record to an output stream, returns bytes written
  static std::size_t serialize(const FileRecord& record, std::ostream& output);
  // Throws store::InvalidInputError on bad magic, version or truncation
  static FileRecord deserialize(std::istream& input);

  static std::vector<uint8_t> encode(const FileRecord& record);
  static FileRecord decode(const std::vector<uint8_t>& data);

private:
  // ---- STREAM OPERATIONS ----
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  static void read_bytes(std::istream& input, void* data, std::size_t size);


  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  static uint32_t to_network_order(uint32_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint64_t to_network_order(uint64_t host_value) {
    return boost::endian::native_to_big(host_value);
  }


  // ---- NETWORK TO HOST BYTE ORDER CONVERSION ----
  static uint32_t from_network_order(uint32_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
  static uint64_t from_network_order(uint64_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace registry
} // namespace nebula

#endif // NEBULA_REGISTRY_RECORD_CODEC_HPP
