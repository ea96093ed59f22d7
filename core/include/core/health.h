#pragma once

#include "core/resource_monitor.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_engine.h"
#include "core/task_error.h"

#include <cstddef>
#include <string>

namespace bgt::core {

/// Point-in-time health report combining the engine and the monitor.
struct HealthSummary {
  std::string status; // "healthy" | "warning" | "critical"
  SystemSnapshot snapshot;
  std::size_t queue_length = 0;
  int active_workers = 0;
  int max_workers = 0;
  SystemStats stats;
  std::string recommendation;
};

/// "critical" above 90% CPU or 90% memory, "warning" above 70% / 75%.
std::string classify_health(const SystemSnapshot &snapshot);

HealthSummary health_summary(const ITaskEngine &engine,
                             const ResourceMonitor &monitor);

/// Cancel every running task below Critical priority, switch the monitor to
/// the low-memory preset and trim the metric history.
/// Returns the number of cancel requests accepted.
std::size_t emergency_cleanup(ITaskEngine &engine, ResourceMonitor &monitor);

struct CompletionEstimate {
  TaskKind kind = TaskKind::TextProcessing;
  double estimated_minutes = 0.0;
  std::size_t queue_position = 0; // 1-based position a new task would take
  double load_multiplier = 1.0;
};

/// Baseline duration for a kind, before load adjustment.
double base_minutes(TaskKind kind);

CompletionEstimate estimate_completion(const ITaskEngine &engine, TaskKind kind);

/// Apply a named limits preset: "low_memory", "performance" or "balanced".
Result<void, TaskError> apply_optimization(ResourceMonitor &monitor,
                                           const std::string &mode);

} // namespace bgt::core
