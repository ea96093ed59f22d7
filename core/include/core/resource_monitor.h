#pragma once

#include "core/result.h"
#include "core/task_error.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <deque>
#include <vector>

namespace bgt::core {

class ILogger;

/// Admission ceilings. Owned by ResourceMonitor and replaced wholesale by
/// set_limits() or one of the optimize_* presets.
struct ResourceLimits {
  std::uint64_t max_memory_mb = 2048;
  double max_cpu_percent = 80.0;
  std::uint32_t max_concurrent_tasks = 4;
  std::uint64_t task_timeout_seconds = 1800; // 0 disables the timeout
};

/// Host readings. Implemented for Linux in infra; tests inject fakes.
class ISystemProbe {
public:
  virtual ~ISystemProbe() = default;

  /// Average CPU utilisation across cores since the previous call, [0, 100].
  virtual double cpu_percent() = 0;
  virtual std::uint64_t memory_used_bytes() = 0;
  virtual std::uint64_t memory_total_bytes() = 0;
  virtual std::uint64_t disk_used_bytes() = 0;
  virtual std::uint64_t disk_total_bytes() = 0;
  virtual unsigned cpu_count() = 0;
};

enum class MetricStatus { Running, Completed, Failed, Cancelled };

const char *to_string(MetricStatus status);

/// Resource usage record for one admitted task.
struct TaskMetrics {
  using WallClock = std::chrono::system_clock;

  std::string task_id;
  std::string kind;
  WallClock::time_point start_time;
  std::optional<WallClock::time_point> end_time;
  std::optional<std::chrono::milliseconds> duration;
  std::uint64_t memory_peak_bytes = 0; // Host memory used at admission
  double cpu_peak_percent = 0.0;       // Host CPU at admission
  MetricStatus status = MetricStatus::Running;

  std::chrono::steady_clock::time_point started_steady;
};

/// Aggregate host + engine view, refreshed by the sampler.
struct SystemSnapshot {
  double cpu_percent = 0.0;
  std::uint64_t memory_used_bytes = 0;
  std::uint64_t memory_total_bytes = 0;
  std::uint64_t disk_used_bytes = 0;
  std::uint64_t disk_total_bytes = 0;
  std::uint32_t active_tasks = 0;
  std::uint32_t completed_tasks = 0;
  std::chrono::milliseconds average_task_duration{0};
  std::chrono::seconds uptime{0};

  /// used / total, 0 when the total is unknown.
  [[nodiscard]] double memory_ratio() const;
};

struct MonitorConfig {
  std::chrono::milliseconds sample_interval{5000};
  std::size_t history_cap = 1000;
  ResourceLimits limits{};
};

/// Tracks admitted tasks against ResourceLimits and samples the host.
///
/// Thread model: the sampler runs on its own thread once start_monitoring()
/// is called. Tracked tasks, the snapshot, the limits and the probe each sit
/// behind their own mutex; lock order is tasks -> probe.
class ResourceMonitor {
public:
  ResourceMonitor(MonitorConfig config, std::shared_ptr<ISystemProbe> probe,
                  std::shared_ptr<ILogger> logger);
  ~ResourceMonitor();

  ResourceMonitor(const ResourceMonitor &) = delete;
  ResourceMonitor &operator=(const ResourceMonitor &) = delete;

  /// Start the periodic sampler. Idempotent.
  void start_monitoring();
  void stop_monitoring();

  /// One synchronous refresh of the snapshot.
  void sample_now();

  /// Admission check. Rejects with ErrorCategory::Admission when the active
  /// count has reached max_concurrent_tasks or host memory is above
  /// max_memory_mb. On success the task is tracked as Running.
  Result<void, TaskError> start_task(const std::string &task_id,
                                     const std::string &kind);

  /// Move a tracked task to the history. Unknown ids are ignored.
  void complete_task(const std::string &task_id, bool success);
  void cancel_task(const std::string &task_id);

  [[nodiscard]] SystemSnapshot snapshot() const;
  [[nodiscard]] std::vector<TaskMetrics> active_tasks() const;
  [[nodiscard]] std::vector<TaskMetrics> completed_history() const;

  /// Pretty-printed JSON document holding the snapshot, the active and
  /// completed task records and the current limits. Times are Unix epoch
  /// milliseconds.
  [[nodiscard]] Result<std::string, TaskError> export_metrics() const;

  /// Advice derived from the latest snapshot and the current limits.
  [[nodiscard]] std::string recommendation() const;

  [[nodiscard]] ResourceLimits limits() const;
  void set_limits(ResourceLimits limits);

  void optimize_for_low_memory();
  void optimize_for_performance();
  void optimize_balanced();

  /// Trim the history to `keep` entries (history_cap when omitted).
  /// Returns the number of records dropped.
  std::size_t cleanup_old_metrics(std::optional<std::size_t> keep = std::nullopt);

  static std::string recommendation_for(const SystemSnapshot &snapshot,
                                        const ResourceLimits &limits);

private:
  void sampler_loop();
  void finish_locked(const std::string &task_id, MetricStatus status);
  void log_info(const std::string &trace, const std::string &event,
                const std::string &msg) const;
  void log_warn(const std::string &trace, const std::string &event,
                const std::string &msg) const;

  MonitorConfig config_;
  std::shared_ptr<ISystemProbe> probe_;
  std::shared_ptr<ILogger> logger_;
  const std::chrono::steady_clock::time_point started_at_;

  mutable std::mutex tasks_mutex_;
  std::unordered_map<std::string, TaskMetrics> active_;
  std::deque<TaskMetrics> history_;

  mutable std::mutex snapshot_mutex_;
  SystemSnapshot snapshot_{};

  mutable std::mutex limits_mutex_;
  ResourceLimits limits_;

  std::mutex probe_mutex_;

  std::mutex sampler_mutex_;
  std::condition_variable sampler_cv_;
  bool sampler_stopping_ = false;
  std::thread sampler_;
};

} // namespace bgt::core
