#include "core/health.h"

namespace bgt::core {

std::string classify_health(const SystemSnapshot &snapshot) {
  const double memory = snapshot.memory_ratio();
  if (snapshot.cpu_percent > 90.0 || memory > 0.9) {
    return "critical";
  }
  if (snapshot.cpu_percent > 70.0 || memory > 0.75) {
    return "warning";
  }
  return "healthy";
}

HealthSummary health_summary(const ITaskEngine &engine,
                             const ResourceMonitor &monitor) {
  HealthSummary summary;
  summary.snapshot = monitor.snapshot();
  summary.status = classify_health(summary.snapshot);
  summary.queue_length = engine.queue_length();
  summary.active_workers = engine.active_workers();
  summary.max_workers = engine.max_workers();
  summary.stats = engine.system_stats();
  summary.recommendation = monitor.recommendation();
  return summary;
}

std::size_t emergency_cleanup(ITaskEngine &engine, ResourceMonitor &monitor) {
  std::size_t cancelled = 0;
  for (const auto &task : engine.get_active()) {
    if (task.priority == TaskPriority::Critical) {
      continue;
    }
    if (engine.cancel(task.id).is_ok()) {
      ++cancelled;
    }
  }

  monitor.optimize_for_low_memory();
  monitor.cleanup_old_metrics();
  return cancelled;
}

double base_minutes(TaskKind kind) {
  switch (kind) {
  case TaskKind::WebScraping:
    return 3.0;
  case TaskKind::TextProcessing:
    return 2.0;
  case TaskKind::ChunkGeneration:
    return 1.5;
  case TaskKind::Export:
    return 1.0;
  case TaskKind::MetadataEnrichment:
    return 4.0;
  case TaskKind::VisualAssetDownload:
    return 2.5;
  case TaskKind::CloudSync:
    return 3.5;
  case TaskKind::Backup:
    return 5.0;
  case TaskKind::QualityAnalysis:
    return 2.0;
  case TaskKind::BatchProcessing:
    return 8.0;
  default:
    return 3.0;
  }
}

CompletionEstimate estimate_completion(const ITaskEngine &engine, TaskKind kind) {
  const auto queued = engine.queue_length();
  const auto active = engine.active_workers();

  CompletionEstimate estimate;
  estimate.kind = kind;
  estimate.load_multiplier =
      1.0 + static_cast<double>(queued) * 0.1 + static_cast<double>(active) * 0.2;
  estimate.estimated_minutes = base_minutes(kind) * estimate.load_multiplier;
  estimate.queue_position = queued + 1;
  return estimate;
}

Result<void, TaskError> apply_optimization(ResourceMonitor &monitor,
                                           const std::string &mode) {
  if (mode == "low_memory") {
    monitor.optimize_for_low_memory();
  } else if (mode == "performance") {
    monitor.optimize_for_performance();
  } else if (mode == "balanced") {
    monitor.optimize_balanced();
  } else {
    return Result<void, TaskError>::Err(TaskError::Submission(
        "Unknown optimization mode: " + mode));
  }
  return Result<void, TaskError>::Ok();
}

} // namespace bgt::core
