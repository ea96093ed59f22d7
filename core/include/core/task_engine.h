#pragma once

#include "core/executor.h"
#include "core/resource_monitor.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bgt::core {

class ILogger;

/// Engine runtime configuration.
struct EngineConfig {
  int max_workers = 4; // <= 0: auto, clamp(hw_threads - 1, 2, 8)
  std::chrono::milliseconds tick_interval{1000}; // Admission loop period
};

/// Aggregate counters returned by system_stats().
struct SystemStats {
  std::size_t total = 0;
  std::size_t completed = 0;
  std::size_t failed = 0;
  std::size_t cancelled = 0;
  std::size_t running = 0;
  std::size_t queued = 0; // Pending queue length
  int active_workers = 0;
  int max_workers = 0;
  double success_rate = 0.0; // completed / total * 100, 0 when empty
};

/// Background task engine.
///
/// Submission is non-blocking: submit() registers the task as Queued and
/// returns its id. A periodic admission loop moves the best queued task to
/// a worker when a worker slot is free and the ResourceMonitor approves.
/// Control requests (cancel/pause/resume/status) travel through an ordered
/// command channel drained by one thread; executor progress travels through
/// a second channel drained by another. Callers read state by pulling
/// get_status()/get_all(); there is no push notification.
class ITaskEngine {
public:
  virtual ~ITaskEngine() = default;

  /// Queue a task. Fails with ErrorCategory::Submission on malformed
  /// metadata or after shutdown().
  virtual Result<std::string, TaskError> submit(TaskKind kind,
                                                TaskPriority priority,
                                                Metadata metadata) = 0;

  /// Request cancellation. Applied asynchronously by the command processor;
  /// fails with NotFound for an unknown id and Channel once the processor
  /// has stopped.
  virtual Result<void, TaskError> cancel(const std::string &task_id) = 0;

  /// Annotate the task message. Running executors are not suspended.
  virtual Result<void, TaskError> pause(const std::string &task_id) = 0;
  virtual Result<void, TaskError> resume(const std::string &task_id) = 0;

  /// Send a GetStatus command; the processor logs the current status.
  virtual Result<void, TaskError> request_status(const std::string &task_id) = 0;

  /// Report progress for a task from outside an executor. Best effort.
  virtual void update_progress(const std::string &task_id, float progress,
                               const std::string &message) = 0;

  [[nodiscard]] virtual std::optional<Task>
  get_status(const std::string &task_id) const = 0;
  [[nodiscard]] virtual std::vector<Task> get_all() const = 0;
  [[nodiscard]] virtual std::vector<Task> get_active() const = 0;
  [[nodiscard]] virtual std::size_t queue_length() const = 0;
  [[nodiscard]] virtual int active_workers() const = 0;
  [[nodiscard]] virtual int max_workers() const = 0;
  [[nodiscard]] virtual SystemStats system_stats() const = 0;

  /// Stop admitting and cancel every running task. Does not wait for
  /// workers; the destructor joins them. Idempotent.
  virtual void shutdown() = 0;
  [[nodiscard]] virtual bool is_shut_down() const = 0;
};

/// Build an engine and start its command, progress, admission and worker
/// threads. `monitor` may be null, in which case admission is gated by the
/// worker ceiling only and no timeout is enforced.
std::unique_ptr<ITaskEngine>
create_task_engine(const EngineConfig &config, ExecutorTable executors,
                   std::shared_ptr<ResourceMonitor> monitor,
                   std::shared_ptr<ILogger> logger);

} // namespace bgt::core
