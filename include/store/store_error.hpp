#ifndef NEBULA_STORE_ERROR_HPP
#define NEBULA_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace nebula {
namespace store {

enum class ErrorKind {
  NOT_FOUND = 0,
  AMBIGUOUS_ID,
  CORRUPT_CHUNK,
  IO_FAILURE,
  INVALID_INPUT
};

inline const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NOT_FOUND: return "NotFound";
    case ErrorKind::AMBIGUOUS_ID: return "AmbiguousId";
    case ErrorKind::CORRUPT_CHUNK: return "CorruptChunk";
    case ErrorKind::IO_FAILURE: return "IoFailure";
    case ErrorKind::INVALID_INPUT: return "InvalidInput";
    default: return "Undefined error";
  }
}

// Base of every error raised by the engine. subject() names the digest,
// file id or path the failure is about.
class StoreError : public std::runtime_error {
public:
  StoreError(ErrorKind kind, const std::string& subject, const std::string& message)
    : std::runtime_error(std::string(error_kind_to_string(kind)) + ": " + message
                         + (subject.empty() ? "" : " [" + subject + "]"))
    , kind_(kind)
    , subject_(subject) {}

  ErrorKind kind() const { return kind_; }
  const std::string& subject() const { return subject_; }

private:
  ErrorKind kind_;
  std::string subject_;
};

class NotFoundError : public StoreError {
public:
  NotFoundError(const std::string& subject, const std::string& message)
    : StoreError(ErrorKind::NOT_FOUND, subject, message) {}
};

class AmbiguousIdError : public StoreError {
public:
  AmbiguousIdError(const std::string& subject, const std::string& message)
    : StoreError(ErrorKind::AMBIGUOUS_ID, subject, message) {}
};

class CorruptChunkError : public StoreError {
public:
  CorruptChunkError(const std::string& subject, const std::string& message)
    : StoreError(ErrorKind::CORRUPT_CHUNK, subject, message) {}
};

class IoError : public StoreError {
public:
  IoError(const std::string& subject, const std::string& message)
    : StoreError(ErrorKind::IO_FAILURE, subject, message) {}
};

class InvalidInputError : public StoreError {
public:
  explicit InvalidInputError(const std::string& message)
    : StoreError(ErrorKind::INVALID_INPUT, "", message) {}
  InvalidInputError(const std::string& subject, const std::string& message)
    : StoreError(ErrorKind::INVALID_INPUT, subject, message) {}
};

} // namespace store
} // namespace nebula

#endif // NEBULA_STORE_ERROR_HPP
