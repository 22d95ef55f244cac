#pragma once

#include <exception>
#include <string>

namespace rag_core {

// Base class for every error raised by the index core
class IndexError : public std::exception {
 public:
  explicit IndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A vector whose length differs from the configured dimension
class DimensionMismatchError : public IndexError {
 public:
  explicit DimensionMismatchError(const std::string &message) : IndexError(message) {}
};

class EmptyBatchError : public IndexError {
 public:
  explicit EmptyBatchError(const std::string &message) : IndexError(message) {}
};

class InvalidQueryError : public IndexError {
 public:
  explicit InvalidQueryError(const std::string &message) : IndexError(message) {}
};

// Malformed ingest document (missing text or embedding field)
class InvalidRecordError : public IndexError {
 public:
  explicit InvalidRecordError(const std::string &message) : IndexError(message) {}
};

// Storage could not be read or written
class IOFailureError : public IndexError {
 public:
  explicit IOFailureError(const std::string &message) : IndexError(message) {}
};

class StoreLockError : public IndexError {
 public:
  explicit StoreLockError(const std::string &message) : IndexError(message) {}
};

}  // namespace rag_core
