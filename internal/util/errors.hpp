#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace scribe::util {

/*
  Central error types.

  Everything thrown below the scheduler is one of these; the task pipeline
  translates them into an ErrorKind that is stored in the ledger.
*/

enum class ErrorKind {
  kNone = 0,
  kValidation,
  kExtraction,
  kTranscription,
  kEmptyResult,
  kPersistence,
  kCancelled,
  kInternal,
};

std::string_view ToString(ErrorKind kind);

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotADirectory : public std::runtime_error {
 public:
  explicit NotADirectory(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  An external engine failed, was killed after stalling or exited non-zero.
  diagnostics() holds the tail of what the engine wrote.
*/
class EngineFailure : public std::runtime_error {
 public:
  EngineFailure(const std::string& msg, std::string diagnostics = {})
      : std::runtime_error(msg), diagnostics_(std::move(diagnostics)) {
  }

  const std::string& diagnostics() const noexcept {
    return diagnostics_;
  }

 private:
  std::string diagnostics_;
};

class ExtractionError : public EngineFailure {
 public:
  using EngineFailure::EngineFailure;
};

class TranscriptionError : public EngineFailure {
 public:
  using EngineFailure::EngineFailure;
};

class EmptyResultError : public std::runtime_error {
 public:
  explicit EmptyResultError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CancelledError : public std::runtime_error {
 public:
  explicit CancelledError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unrecoverable before any task is scheduled.
class SetupError : public std::runtime_error {
 public:
  explicit SetupError(const std::string& msg) : std::runtime_error(msg) {
  }
};

inline std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "";
    case ErrorKind::kValidation:
      return "ValidationError";
    case ErrorKind::kExtraction:
      return "ExtractionError";
    case ErrorKind::kTranscription:
      return "TranscriptionError";
    case ErrorKind::kEmptyResult:
      return "EmptyResultError";
    case ErrorKind::kPersistence:
      return "PersistenceError";
    case ErrorKind::kCancelled:
      return "CancelledError";
    case ErrorKind::kInternal:
      return "InternalError";
  }
  return "InternalError";
}

} // namespace scribe::util
