#include "crypto/hasher.hpp"
#include "crypto/crypto_error.hpp"
#include "store/store_error.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace nebula::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Hasher: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Hasher::Hasher() : context_(std::make_unique<DigestContext>()) {
  reset();
}

Hasher::~Hasher() = default;

void Hasher::reset() {
  if (!EVP_DigestInit_ex(context_->get(), EVP_sha256(), nullptr)) {
    throw DigestError("Hasher: Failed to initialize hash context");
  }
}


//==============================================
// INCREMENTAL HASHING
//==============================================

void Hasher::update(const uint8_t* data, size_t size) {
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw DigestError("Hasher: Failed to update hash");
  }
}

Digest Hasher::finish() {
  Digest result;
  unsigned int hash_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), result.data(), &hash_len) || hash_len != DIGEST_SIZE) {
    throw DigestError("Hasher: Failed to finalize hash");
  }

  // Leave the context ready for the next digest
  reset();
  return result;
}


//==============================================
// ONE-SHOT HASHING
//==============================================

Digest Hasher::digest(const uint8_t* data, size_t size) {
  Hasher hasher;
  hasher.update(data, size);
  return hasher.finish();
}

Digest Hasher::digest(const std::vector<uint8_t>& data) {
  return digest(data.data(), data.size());
}

Digest Hasher::digest(const std::string& data) {
  return digest(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Digest Hasher::digest(std::istream& input) {
  Hasher hasher;
  char buffer[8192];

  while (input.read(buffer, sizeof(buffer))) {
    hasher.update(reinterpret_cast<const uint8_t*>(buffer), static_cast<size_t>(input.gcount()));
  }
  // Handle final partial block if present
  if (input.gcount() > 0) {
    hasher.update(reinterpret_cast<const uint8_t*>(buffer), static_cast<size_t>(input.gcount()));
  }

  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Hasher: Input stream failed while hashing";
    throw store::IoError("", "Hasher: Failed to read input stream");
  }
  return hasher.finish();
}


//==============================================
// HEX CONVERSION
//==============================================

std::string Hasher::to_hex(const Digest& digest) {
  std::stringstream ss;
  for (uint8_t byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::string Hasher::short_hex(const Digest& digest) {
  return to_hex(digest).substr(0, SHORT_HEX_LENGTH);
}

Digest Hasher::from_hex(const std::string& hex) {
  if (hex.size() != DIGEST_SIZE * 2) {
    throw store::InvalidInputError(hex, "Hasher: Digest must be 64 hex characters");
  }

  auto nibble = [&hex](char c) -> uint8_t {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    throw store::InvalidInputError(hex, "Hasher: Invalid hex character in digest");
  };

  Digest result;
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    result[i] = static_cast<uint8_t>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
  }
  return result;
}

} // namespace nebula::crypto
