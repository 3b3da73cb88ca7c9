#ifndef NEBULA_STORE_CHUNKER_HPP
#define NEBULA_STORE_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <vector>

namespace nebula {
namespace store {

// Largest accepted max_size; the chunker buffers twice this much
constexpr size_t MAX_CHUNK_SIZE = 64 * 1024 * 1024;

// Chunk size profile. Every chunk except the last one of a stream is
// between min_size and max_size bytes.
struct ChunkerConfig {
  size_t min_size = 4 * 1024;
  size_t avg_size = 8 * 1024;
  size_t max_size = 16 * 1024;
  // Content-defined boundaries; when false, cut every avg_size bytes
  bool content_defined = true;

  // Throws InvalidInputError for zero bounds, min > avg > max ordering
  // violations, or max_size above MAX_CHUNK_SIZE
  void validate() const;
};

struct ChunkSpan {
  uint64_t offset = 0;
  size_t length = 0;
  std::vector<uint8_t> bytes;
};

// Pulls chunks from an input stream one at a time. The stream is consumed
// once; to chunk again, reopen the source. At most 2 * max_size bytes are
// buffered.
class Chunker {
public:
  // ---- CONSTRUCTOR ----
  explicit Chunker(std::istream& input, const ChunkerConfig& config = ChunkerConfig());


  // ---- ITERATION ----
  // Returns the next chunk, or nullopt once the stream is exhausted
  std::optional<ChunkSpan> next();


  // ---- GETTERS ----
  uint64_t bytes_consumed() const { return offset_; }
  const ChunkerConfig& config() const { return config_; }


  // ---- CUT POINT SEARCH ----
  // Length of the first chunk of data[0, size) under the given profile.
  // size must not exceed the bytes actually available; passing fewer than
  // max_size bytes means the caller has reached end of input.
  static size_t find_cut_point(const uint8_t* data, size_t size, const ChunkerConfig& config);

private:
  // ---- PARAMETERS ----
  std::istream& input_;
  ChunkerConfig config_;
  std::vector<uint8_t> buffer_;
  size_t start_ = 0;        // first unconsumed byte in buffer_
  size_t end_ = 0;          // one past last valid byte in buffer_
  uint64_t offset_ = 0;     // stream offset of buffer_[start_]
  bool eof_ = false;


  // ---- BUFFER MANAGEMENT ----
  // Compacts pending bytes to the front and reads until full or EOF
  void fill();
};

} // namespace store
} // namespace nebula

#endif // NEBULA_STORE_CHUNKER_HPP
