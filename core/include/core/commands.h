#pragma once

#include "core/cancel_token.h"
#include "core/task.h"

#include <optional>
#include <string>
#include <variant>

namespace bgt::core {

// ---- Command channel messages ----

struct CancelCommand {
  std::string task_id;
  CancelReason reason = CancelReason::User;
};

/// Pause/Resume only annotate the task message; running executors are not
/// suspended.
struct PauseCommand {
  std::string task_id;
};

struct ResumeCommand {
  std::string task_id;
};

struct StatusCommand {
  std::string task_id;
};

using TaskCommand =
    std::variant<CancelCommand, PauseCommand, ResumeCommand, StatusCommand>;

const char *command_name(const TaskCommand &command);

// ---- Progress channel messages ----

struct ProgressEvent {
  std::string task_id;
  float progress = 0.0f; // Clamped to [0, 100] when applied
  std::string message;
  std::optional<Metadata> metadata; // Merged key-wise into Task::metadata
};

} // namespace bgt::core
