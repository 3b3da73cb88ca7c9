#ifndef NEBULA_CRYPTO_HASHER_HPP
#define NEBULA_CRYPTO_HASHER_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace nebula::crypto {

static constexpr size_t DIGEST_SIZE = 32;  // SHA-256
static constexpr size_t SHORT_HEX_LENGTH = 8;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

// Forward declaration for OpenSSL digest context
struct DigestContext;

class Hasher {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Hasher();
  ~Hasher();

  Hasher(const Hasher&) = delete;
  Hasher& operator=(const Hasher&) = delete;


  // ---- INCREMENTAL HASHING ----
  // Feeds bytes into the running digest
  void update(const uint8_t* data, size_t size);
  void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
  // Returns the digest of everything fed so far and resets the context
  Digest finish();


  // ---- ONE-SHOT HASHING ----
  static Digest digest(const uint8_t* data, size_t size);
  static Digest digest(const std::vector<uint8_t>& data);
  static Digest digest(const std::string& data);
  // Hashes the remainder of a stream
  static Digest digest(std::istream& input);


  // ---- HEX CONVERSION ----
  static std::string to_hex(const Digest& digest);
  // First SHORT_HEX_LENGTH characters of the hex form, for display
  static std::string short_hex(const Digest& digest);
  // Throws store::InvalidInputError if hex is not 64 hex characters
  static Digest from_hex(const std::string& hex);

private:
  std::unique_ptr<DigestContext> context_;

  void reset();
};

} // namespace nebula::crypto

#endif // NEBULA_CRYPTO_HASHER_HPP
