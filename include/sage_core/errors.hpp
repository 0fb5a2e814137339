#pragma once

#include <exception>
#include <string>

namespace sage_core {

enum class ErrorKind {
  InvalidConfiguration,
  InvalidArgument,
  EmptyDocument,
  DuplicateDocument,
  DimensionMismatch,
  EmptyIndex,
  OutOfRange,
  PersistenceFailure,
  ModelFailure,
  Internal
};

inline std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidConfiguration:
      return "invalid_configuration";
    case ErrorKind::InvalidArgument:
      return "invalid_argument";
    case ErrorKind::EmptyDocument:
      return "empty_document";
    case ErrorKind::DuplicateDocument:
      return "duplicate_document";
    case ErrorKind::DimensionMismatch:
      return "dimension_mismatch";
    case ErrorKind::EmptyIndex:
      return "empty_index";
    case ErrorKind::OutOfRange:
      return "out_of_range";
    case ErrorKind::PersistenceFailure:
      return "persistence_failure";
    case ErrorKind::ModelFailure:
      return "model_failure";
    case ErrorKind::Internal:
      return "internal";
    default:
      return "unknown";
  }
}

class SageError : public std::exception {
 public:
  SageError(ErrorKind kind, const std::string &message) : kind_(kind), message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
  std::string message_;
};

class InvalidConfigurationError : public SageError {
 public:
  explicit InvalidConfigurationError(const std::string &message)
      : SageError(ErrorKind::InvalidConfiguration, message) {}
};

class InvalidArgumentError : public SageError {
 public:
  explicit InvalidArgumentError(const std::string &message)
      : SageError(ErrorKind::InvalidArgument, message) {}
};

class EmptyDocumentError : public SageError {
 public:
  explicit EmptyDocumentError(const std::string &message)
      : SageError(ErrorKind::EmptyDocument, message) {}
};

class DuplicateDocumentError : public SageError {
 public:
  explicit DuplicateDocumentError(const std::string &message)
      : SageError(ErrorKind::DuplicateDocument, message) {}
};

class DimensionMismatchError : public SageError {
 public:
  explicit DimensionMismatchError(const std::string &message)
      : SageError(ErrorKind::DimensionMismatch, message) {}
};

// Raised when a query arrives before anything was ingested. Callers are expected to
// surface this to the user rather than treat it as a fault.
class EmptyIndexError : public SageError {
 public:
  explicit EmptyIndexError(const std::string &message)
      : SageError(ErrorKind::EmptyIndex, message) {}
};

class OutOfRangeError : public SageError {
 public:
  explicit OutOfRangeError(const std::string &message)
      : SageError(ErrorKind::OutOfRange, message) {}
};

class PersistenceError : public SageError {
 public:
  explicit PersistenceError(const std::string &message)
      : SageError(ErrorKind::PersistenceFailure, message) {}
};

class ModelError : public SageError {
 public:
  explicit ModelError(const std::string &message)
      : SageError(ErrorKind::ModelFailure, message) {}
};

}  // namespace sage_core
