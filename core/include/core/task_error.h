#pragma once

#include <map>
#include <string>

namespace bgt::core {

/// Error categories. Lets callers branch on the failure class without
/// parsing messages.
enum class ErrorCategory {
  Submission, // Malformed input, rejected before enqueue
  Admission,  // Concurrency or memory ceiling reached
  Execution,  // External executor reported a failure
  Channel,    // Command/progress consumer no longer running
  Canceled,   // User, shutdown or emergency cancellation
  Timeout,    // task_timeout_seconds exceeded
  NotFound,   // Unknown task id
  Internal,   // Programming error / invariant violation
  Unknown
};

/// Structured error type for every engine operation.
struct TaskError {
  ErrorCategory category = ErrorCategory::Unknown;
  int code = 0;               // Numeric code for log aggregation
  bool retryable = false;     // Deferred admission is retryable, failures are not
  std::string message;        // User-facing text, stored on Task::error
  std::string internal_message; // Technical detail for logging
  std::map<std::string, std::string> details;

  TaskError() = default;

  TaskError(ErrorCategory cat, int c, std::string msg)
      : category(cat), code(c), message(std::move(msg)),
        internal_message(message) {}

  TaskError(ErrorCategory cat, int c, bool retry, std::string msg,
            std::string internal_msg,
            std::map<std::string, std::string> dets = {})
      : category(cat), code(c), retryable(retry), message(std::move(msg)),
        internal_message(std::move(internal_msg)), details(std::move(dets)) {}

  static TaskError Submission(std::string msg) {
    return {ErrorCategory::Submission, 1001, std::move(msg)};
  }
  static TaskError Admission(std::string msg) {
    return {ErrorCategory::Admission, 2001, true, msg, msg};
  }
  static TaskError Execution(std::string msg) {
    return {ErrorCategory::Execution, 3001, std::move(msg)};
  }
  static TaskError Channel(std::string msg) {
    return {ErrorCategory::Channel, 4001, std::move(msg)};
  }
  static TaskError Canceled(std::string msg = "Operation canceled") {
    return {ErrorCategory::Canceled, 5001, std::move(msg)};
  }
  static TaskError Timeout(std::string msg = "Deadline exceeded") {
    return {ErrorCategory::Timeout, 5002, std::move(msg)};
  }
  static TaskError NotFound(const std::string &task_id) {
    return {ErrorCategory::NotFound, 6001, "Task not found: " + task_id};
  }
  static TaskError Internal(std::string msg) {
    return {ErrorCategory::Internal, 9001, std::move(msg)};
  }
};

inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::Submission:
    return "Submission";
  case ErrorCategory::Admission:
    return "Admission";
  case ErrorCategory::Execution:
    return "Execution";
  case ErrorCategory::Channel:
    return "Channel";
  case ErrorCategory::Canceled:
    return "Canceled";
  case ErrorCategory::Timeout:
    return "Timeout";
  case ErrorCategory::NotFound:
    return "NotFound";
  case ErrorCategory::Internal:
    return "Internal";
  case ErrorCategory::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

} // namespace bgt::core
