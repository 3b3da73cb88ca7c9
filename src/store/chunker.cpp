#include "store/chunker.hpp"
#include "store/store_error.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <string>
#include <boost/log/trivial.hpp>

namespace nebula {
namespace store {

namespace {

// Gear table for the rolling hash, filled with splitmix64 output so the
// boundaries are stable across builds and platforms.
constexpr std::array<uint64_t, 256> make_gear_table() {
  std::array<uint64_t, 256> table{};
  uint64_t state = 0x6e6562756c61ULL;
  for (size_t i = 0; i < table.size(); ++i) {
    state += 0x9E3779B97F4A7C15ULL;
    uint64_t z = state;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    table[i] = z ^ (z >> 31);
  }
  return table;
}

constexpr std::array<uint64_t, 256> GEAR = make_gear_table();

// Mask with the given number of high bits set. The gear hash shifts left,
// so high bits depend on the widest window of recent bytes.
uint64_t high_bit_mask(unsigned bits) {
  if (bits == 0) {
    return 0;
  }
  if (bits >= 64) {
    return ~0ULL;
  }
  return ~0ULL << (64 - bits);
}

unsigned floor_log2(size_t value) {
  unsigned bits = 0;
  while (value > 1) {
    value >>= 1;
    ++bits;
  }
  return bits;
}

} // namespace


//==============================================
// CONFIGURATION
//==============================================

void ChunkerConfig::validate() const {
  if (min_size == 0 || avg_size == 0 || max_size == 0) {
    throw InvalidInputError("Chunker: Chunk size bounds must be greater than zero");
  }
  if (min_size > avg_size) {
    throw InvalidInputError("Chunker: min_size " + std::to_string(min_size)
                            + " exceeds avg_size " + std::to_string(avg_size));
  }
  if (avg_size > max_size) {
    throw InvalidInputError("Chunker: avg_size " + std::to_string(avg_size)
                            + " exceeds max_size " + std::to_string(max_size));
  }
  if (max_size > MAX_CHUNK_SIZE) {
    throw InvalidInputError("Chunker: max_size " + std::to_string(max_size)
                            + " exceeds the limit of " + std::to_string(MAX_CHUNK_SIZE));
  }
}


//==============================================
// CONSTRUCTOR
//==============================================

Chunker::Chunker(std::istream& input, const ChunkerConfig& config)
  : input_(input)
  , config_(config) {
  config_.validate();
  buffer_.resize(2 * config_.max_size);
  BOOST_LOG_TRIVIAL(debug) << "Chunker: Initialized with min " << config_.min_size
                           << ", avg " << config_.avg_size << ", max " << config_.max_size
                           << (config_.content_defined ? " (content-defined)" : " (fixed-size)");
}


//==============================================
// ITERATION
//==============================================

std::optional<ChunkSpan> Chunker::next() {
  if (end_ - start_ < config_.max_size && !eof_) {
    fill();
  }

  size_t pending = end_ - start_;
  if (pending == 0) {
    return std::nullopt;
  }

  size_t cut = find_cut_point(buffer_.data() + start_, pending, config_);

  ChunkSpan span;
  span.offset = offset_;
  span.length = cut;
  span.bytes.assign(buffer_.begin() + start_, buffer_.begin() + start_ + cut);

  start_ += cut;
  offset_ += cut;

  BOOST_LOG_TRIVIAL(trace) << "Chunker: Emitted chunk at offset " << span.offset
                           << " with length " << span.length;
  return span;
}


//==============================================
// BUFFER MANAGEMENT
//==============================================

void Chunker::fill() {
  size_t pending = end_ - start_;
  if (start_ > 0 && pending > 0) {
    std::memmove(buffer_.data(), buffer_.data() + start_, pending);
  }
  start_ = 0;
  end_ = pending;

  while (end_ < buffer_.size() && !eof_) {
    input_.read(reinterpret_cast<char*>(buffer_.data() + end_),
                static_cast<std::streamsize>(buffer_.size() - end_));
    std::streamsize got = input_.gcount();
    end_ += static_cast<size_t>(got);

    if (input_.bad()) {
      BOOST_LOG_TRIVIAL(error) << "Chunker: Input stream failed at offset " << offset_ + end_;
      throw IoError("", "Chunker: Failed to read input stream");
    }
    if (input_.eof() || got == 0) {
      eof_ = true;
    }
  }
}


//==============================================
// CUT POINT SEARCH
//==============================================

size_t Chunker::find_cut_point(const uint8_t* data, size_t size, const ChunkerConfig& config) {
  if (!config.content_defined) {
    return std::min(size, config.avg_size);
  }

  if (size <= config.min_size) {
    return size;
  }

  size_t limit = std::min(size, config.max_size);
  size_t normal = std::min(limit, config.avg_size);

  // Normalized chunking: a stricter mask before the average size and a
  // looser one after it pulls chunk lengths towards avg_size.
  unsigned bits = floor_log2(config.avg_size);
  uint64_t mask_small = high_bit_mask(bits + 1);
  uint64_t mask_large = high_bit_mask(bits > 1 ? bits - 1 : 1);

  uint64_t hash = 0;
  size_t i = config.min_size;

  for (; i < normal; ++i) {
    hash = (hash << 1) + GEAR[data[i]];
    if ((hash & mask_small) == 0) {
      return i + 1;
    }
  }

  for (; i < limit; ++i) {
    hash = (hash << 1) + GEAR[data[i]];
    if ((hash & mask_large) == 0) {
      return i + 1;
    }
  }

  return limit;
}

} // namespace store
} // namespace nebula
