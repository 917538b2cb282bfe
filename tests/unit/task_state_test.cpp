#include "internal/model/task_state.hpp"

#include <cassert>
#include <iostream>

namespace {

using scribe::model::CanTransition;
using scribe::model::IsTerminal;
using scribe::model::TaskState;

static_assert(CanTransition(TaskState::kPending, TaskState::kValidated));
static_assert(!CanTransition(TaskState::kPending, TaskState::kTranscribed));
static_assert(!CanTransition(TaskState::kDone, TaskState::kFailed));

void TestHappyPathIsOrdered() {
  const TaskState path[] = {TaskState::kPending,       TaskState::kValidated,     TaskState::kAudioExtracted,
                            TaskState::kTranscribed,   TaskState::kOutputWritten, TaskState::kLedgerUpdated,
                            TaskState::kRelocated,     TaskState::kDone};
  for (size_t i = 1; i < sizeof(path) / sizeof(path[0]); ++i) {
    assert(CanTransition(path[i - 1], path[i]));
  }
}

void TestRelocationIsOptional() {
  assert(CanTransition(TaskState::kLedgerUpdated, TaskState::kDone));
  assert(!CanTransition(TaskState::kOutputWritten, TaskState::kDone));
}

void TestFailuresRecordLedgerFromAnyStage() {
  assert(CanTransition(TaskState::kPending, TaskState::kLedgerUpdated));
  assert(CanTransition(TaskState::kAudioExtracted, TaskState::kLedgerUpdated));
  assert(!CanTransition(TaskState::kRelocated, TaskState::kLedgerUpdated));
}

void TestTerminalStates() {
  assert(IsTerminal(TaskState::kDone));
  assert(IsTerminal(TaskState::kFailed));
  assert(IsTerminal(TaskState::kCancelled));
  assert(!IsTerminal(TaskState::kLedgerUpdated));
  assert(CanTransition(TaskState::kTranscribed, TaskState::kCancelled));
  assert(!CanTransition(TaskState::kCancelled, TaskState::kPending));
}

} // namespace

int main() {
  TestHappyPathIsOrdered();
  TestRelocationIsOptional();
  TestFailuresRecordLedgerFromAnyStage();
  TestTerminalStates();

  std::cout << "mediascribe_unit_task_state: pass\n";
  return 0;
}
