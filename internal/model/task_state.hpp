#pragma once

#include <cstdint>
#include <string_view>

namespace scribe::model {

enum class TaskState : std::uint8_t {
  kPending        = 0,
  kValidated      = 1,
  kAudioExtracted = 2,
  kTranscribed    = 3,
  kOutputWritten  = 4,
  kLedgerUpdated  = 5,
  kRelocated      = 6,
  kDone           = 7,
  kFailed         = 8,
  kCancelled      = 9,
};

constexpr bool IsTerminal(TaskState state) {
  return state == TaskState::kDone || state == TaskState::kFailed || state == TaskState::kCancelled;
}

constexpr bool CanTransition(TaskState from, TaskState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == TaskState::kFailed || to == TaskState::kCancelled) {
    return true;
  }
  // Failures still record a ledger entry before terminating.
  if (to == TaskState::kLedgerUpdated) {
    return from != TaskState::kLedgerUpdated && from != TaskState::kRelocated;
  }
  // Relocation is optional.
  if (to == TaskState::kDone) {
    return from == TaskState::kLedgerUpdated || from == TaskState::kRelocated;
  }

  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view ToString(TaskState state) {
  switch (state) {
    case TaskState::kPending:
      return "pending";
    case TaskState::kValidated:
      return "validated";
    case TaskState::kAudioExtracted:
      return "audio_extracted";
    case TaskState::kTranscribed:
      return "transcribed";
    case TaskState::kOutputWritten:
      return "output_written";
    case TaskState::kLedgerUpdated:
      return "ledger_updated";
    case TaskState::kRelocated:
      return "relocated";
    case TaskState::kDone:
      return "done";
    case TaskState::kFailed:
      return "failed";
    case TaskState::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

} // namespace scribe::model
