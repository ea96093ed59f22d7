#pragma once

#include "core/result.h"
#include "core/task_error.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace bgt::core {

// ---- Task Status ----

enum class TaskStatus {
  Queued,    // Waiting in the pending queue
  Running,   // Admitted, executor invoked
  Completed, // Executor returned Ok (terminal)
  Failed,    // Executor error or timeout (terminal)
  Cancelled  // Cancel command, shutdown or emergency cleanup (terminal)
};

const char *to_string(TaskStatus status);

/// Completed, Failed and Cancelled accept no further transition.
bool is_terminal(TaskStatus status);

// ---- Task Priority ----

/// Ordered: a higher underlying value is admitted first.
enum class TaskPriority { Low = 1, Normal = 2, High = 3, Critical = 4 };

const char *to_string(TaskPriority priority);

/// Parses "low" | "normal" | "high" | "critical".
std::optional<TaskPriority> parse_task_priority(const std::string &name);

// ---- Task Kind ----

/// Closed set of payload categories. Each kind binds to one executor
/// adapter through the table in core/executor.h.
enum class TaskKind {
  WebScraping,
  TextProcessing,
  ChunkGeneration,
  Export,
  MetadataEnrichment,
  VisualAssetDownload,
  CloudSync,
  Backup,
  QualityAnalysis,
  BatchProcessing,
  AdvancedChunking,
  QualityAssessment,
  RelationshipExtraction,
  PythonPackageInstall
};

inline constexpr std::size_t kTaskKindCount = 14;

/// snake_case name, e.g. "web_scraping".
const char *to_string(TaskKind kind);

std::optional<TaskKind> parse_task_kind(const std::string &name);

/// Opaque key-value payload handed to the executor.
using Metadata = std::map<std::string, std::string>;

// ---- Task ----

/// One unit of schedulable work. Copies of this record are what callers
/// observe; the authoritative copy lives in the TaskRegistry.
struct Task {
  using Clock = std::chrono::system_clock;
  using TimePoint = Clock::time_point;

  std::string id;
  TaskKind kind = TaskKind::TextProcessing;
  TaskPriority priority = TaskPriority::Normal;
  TaskStatus status = TaskStatus::Queued;
  float progress = 0.0f; // [0, 100]
  std::string message = "Task queued";
  Metadata metadata;

  TimePoint created_at = Clock::now();
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;

  std::optional<TaskError> error;

  /// Attempt a status transition. Returns Err if the transition is illegal.
  /// Legal transitions:
  ///   Queued  -> Running, Cancelled
  ///   Running -> Completed, Failed, Cancelled
  /// Stamps started_at on Running and completed_at on any terminal status.
  Result<void, TaskError> transition_to(TaskStatus next);

  /// Clamp to [0, 100] and store.
  void set_progress(float p);

  [[nodiscard]] bool is_terminal() const { return core::is_terminal(status); }
};

} // namespace bgt::core
