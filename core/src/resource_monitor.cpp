#include "core/resource_monitor.h"

#include "core/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>
#include <utility>

namespace bgt::core {

namespace {

constexpr std::uint64_t kBytesPerMb = 1024ULL * 1024ULL;
constexpr std::uint64_t kBytesPerGb = 1024ULL * kBytesPerMb;

ResourceLimits low_memory_preset(ResourceLimits base) {
  base.max_memory_mb = 1024;
  base.max_concurrent_tasks = 2;
  return base;
}

std::int64_t epoch_ms(TaskMetrics::WallClock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

nlohmann::json metrics_to_json(const TaskMetrics &m) {
  nlohmann::json j;
  j["task_id"] = m.task_id;
  j["task_type"] = m.kind;
  j["start_time"] = epoch_ms(m.start_time);
  j["end_time"] = m.end_time ? nlohmann::json(epoch_ms(*m.end_time))
                              : nlohmann::json(nullptr);
  j["duration_ms"] = m.duration ? nlohmann::json(m.duration->count())
                                : nlohmann::json(nullptr);
  j["memory_peak"] = m.memory_peak_bytes;
  j["cpu_peak"] = m.cpu_peak_percent;
  j["status"] = to_string(m.status);
  return j;
}

nlohmann::json snapshot_to_json(const SystemSnapshot &s) {
  return {{"cpu_usage", s.cpu_percent},
          {"memory_usage", s.memory_used_bytes},
          {"memory_total", s.memory_total_bytes},
          {"disk_usage", s.disk_used_bytes},
          {"disk_total", s.disk_total_bytes},
          {"active_tasks", s.active_tasks},
          {"completed_tasks", s.completed_tasks},
          {"average_task_duration_ms", s.average_task_duration.count()},
          {"uptime_s", s.uptime.count()}};
}

nlohmann::json limits_to_json(const ResourceLimits &l) {
  return {{"max_memory_mb", l.max_memory_mb},
          {"max_cpu_percent", l.max_cpu_percent},
          {"max_concurrent_tasks", l.max_concurrent_tasks},
          {"task_timeout_seconds", l.task_timeout_seconds}};
}

} // namespace

const char *to_string(MetricStatus status) {
  switch (status) {
  case MetricStatus::Running:
    return "Running";
  case MetricStatus::Completed:
    return "Completed";
  case MetricStatus::Failed:
    return "Failed";
  case MetricStatus::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

double SystemSnapshot::memory_ratio() const {
  if (memory_total_bytes == 0) {
    return 0.0;
  }
  return static_cast<double>(memory_used_bytes) /
         static_cast<double>(memory_total_bytes);
}

ResourceMonitor::ResourceMonitor(MonitorConfig config,
                                 std::shared_ptr<ISystemProbe> probe,
                                 std::shared_ptr<ILogger> logger)
    : config_(std::move(config)), probe_(std::move(probe)),
      logger_(std::move(logger)), started_at_(std::chrono::steady_clock::now()),
      limits_(config_.limits) {
  if (config_.sample_interval.count() <= 0) {
    config_.sample_interval = std::chrono::milliseconds(5000);
  }
  if (config_.history_cap == 0) {
    config_.history_cap = 1000;
  }
  if (probe_) {
    std::lock_guard<std::mutex> lock(probe_mutex_);
    snapshot_.memory_total_bytes = probe_->memory_total_bytes();
    snapshot_.disk_total_bytes = probe_->disk_total_bytes();
  }
}

ResourceMonitor::~ResourceMonitor() { stop_monitoring(); }

void ResourceMonitor::start_monitoring() {
  std::lock_guard<std::mutex> lock(sampler_mutex_);
  if (sampler_.joinable()) {
    return;
  }
  sampler_stopping_ = false;
  sampler_ = std::thread([this]() { sampler_loop(); });
  log_info("monitor", "monitoring_started",
           "interval_ms=" + std::to_string(config_.sample_interval.count()));
}

void ResourceMonitor::stop_monitoring() {
  std::thread sampler;
  {
    std::lock_guard<std::mutex> lock(sampler_mutex_);
    sampler_stopping_ = true;
    sampler = std::move(sampler_);
  }
  sampler_cv_.notify_all();
  if (sampler.joinable()) {
    sampler.join();
  }
}

void ResourceMonitor::sampler_loop() {
  while (true) {
    sample_now();

    std::unique_lock<std::mutex> lock(sampler_mutex_);
    if (sampler_cv_.wait_for(lock, config_.sample_interval,
                             [this]() { return sampler_stopping_; })) {
      return;
    }
  }
}

void ResourceMonitor::sample_now() {
  double cpu = 0.0;
  std::uint64_t mem_used = 0;
  std::uint64_t mem_total = 0;
  std::uint64_t disk_used = 0;
  std::uint64_t disk_total = 0;
  if (probe_) {
    std::lock_guard<std::mutex> lock(probe_mutex_);
    cpu = probe_->cpu_percent();
    mem_used = probe_->memory_used_bytes();
    mem_total = probe_->memory_total_bytes();
    disk_used = probe_->disk_used_bytes();
    disk_total = probe_->disk_total_bytes();
  }

  std::uint32_t active = 0;
  {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    active = static_cast<std::uint32_t>(active_.size());
  }

  const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::steady_clock::now() - started_at_);
  {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_.cpu_percent = cpu;
    snapshot_.memory_used_bytes = mem_used;
    snapshot_.memory_total_bytes = mem_total;
    snapshot_.disk_used_bytes = disk_used;
    snapshot_.disk_total_bytes = disk_total;
    snapshot_.active_tasks = active;
    snapshot_.uptime = uptime;
  }

  if (logger_) {
    std::ostringstream oss;
    oss.precision(1);
    oss << std::fixed << "cpu=" << cpu << "% memory_mb=" << mem_used / kBytesPerMb
        << " active=" << active;
    logger_->debug("monitor", "resource_monitor", "sample", oss.str());
  }
}

Result<void, TaskError> ResourceMonitor::start_task(const std::string &task_id,
                                                    const std::string &kind) {
  const ResourceLimits limits = this->limits();

  std::lock_guard<std::mutex> lock(tasks_mutex_);
  if (active_.size() >= limits.max_concurrent_tasks) {
    return Result<void, TaskError>::Err(TaskError(
        ErrorCategory::Admission, 2001, true,
        "Cannot start task: maximum concurrent tasks (" +
            std::to_string(limits.max_concurrent_tasks) + ") reached",
        "active_count >= max_concurrent_tasks",
        {{"task_id", task_id},
         {"active", std::to_string(active_.size())},
         {"max_concurrent_tasks", std::to_string(limits.max_concurrent_tasks)}}));
  }

  std::uint64_t memory_used = 0;
  if (probe_) {
    std::lock_guard<std::mutex> probe_lock(probe_mutex_);
    memory_used = probe_->memory_used_bytes();
  }
  if (memory_used > limits.max_memory_mb * kBytesPerMb) {
    return Result<void, TaskError>::Err(TaskError(
        ErrorCategory::Admission, 2002, true,
        "Cannot start task: memory limit exceeded",
        "memory_used > max_memory_mb",
        {{"task_id", task_id},
         {"memory_used_mb", std::to_string(memory_used / kBytesPerMb)},
         {"max_memory_mb", std::to_string(limits.max_memory_mb)}}));
  }

  TaskMetrics metrics;
  metrics.task_id = task_id;
  metrics.kind = kind;
  metrics.start_time = TaskMetrics::WallClock::now();
  metrics.started_steady = std::chrono::steady_clock::now();
  metrics.memory_peak_bytes = memory_used;
  metrics.cpu_peak_percent = snapshot().cpu_percent;
  active_[task_id] = std::move(metrics);

  {
    std::lock_guard<std::mutex> snap_lock(snapshot_mutex_);
    snapshot_.active_tasks = static_cast<std::uint32_t>(active_.size());
  }

  log_info(task_id, "task_tracked", "kind=" + kind);
  return Result<void, TaskError>::Ok();
}

void ResourceMonitor::complete_task(const std::string &task_id, bool success) {
  std::lock_guard<std::mutex> lock(tasks_mutex_);
  finish_locked(task_id, success ? MetricStatus::Completed : MetricStatus::Failed);
}

void ResourceMonitor::cancel_task(const std::string &task_id) {
  std::lock_guard<std::mutex> lock(tasks_mutex_);
  finish_locked(task_id, MetricStatus::Cancelled);
}

void ResourceMonitor::finish_locked(const std::string &task_id,
                                    MetricStatus status) {
  auto it = active_.find(task_id);
  if (it == active_.end()) {
    return;
  }

  TaskMetrics metrics = std::move(it->second);
  active_.erase(it);

  metrics.end_time = TaskMetrics::WallClock::now();
  metrics.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - metrics.started_steady);
  metrics.status = status;
  const auto duration_ms = metrics.duration->count();

  history_.push_back(std::move(metrics));
  while (history_.size() > config_.history_cap) {
    history_.pop_front();
  }

  long long total_ms = 0;
  for (const auto &m : history_) {
    total_ms += m.duration ? m.duration->count() : 0;
  }
  const auto average =
      std::chrono::milliseconds(total_ms / static_cast<long long>(history_.size()));

  {
    std::lock_guard<std::mutex> snap_lock(snapshot_mutex_);
    snapshot_.active_tasks = static_cast<std::uint32_t>(active_.size());
    snapshot_.completed_tasks = static_cast<std::uint32_t>(history_.size());
    snapshot_.average_task_duration = average;
  }

  if (status == MetricStatus::Cancelled) {
    log_warn(task_id, "task_untracked", "cancelled after " +
                                            std::to_string(duration_ms) + "ms");
  } else {
    log_info(task_id, "task_untracked",
             std::string(to_string(status)) + " in " +
                 std::to_string(duration_ms) + "ms");
  }
}

SystemSnapshot ResourceMonitor::snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

std::vector<TaskMetrics> ResourceMonitor::active_tasks() const {
  std::vector<TaskMetrics> out;
  std::lock_guard<std::mutex> lock(tasks_mutex_);
  out.reserve(active_.size());
  for (const auto &[_, m] : active_) {
    out.push_back(m);
  }
  return out;
}

std::vector<TaskMetrics> ResourceMonitor::completed_history() const {
  std::lock_guard<std::mutex> lock(tasks_mutex_);
  return {history_.begin(), history_.end()};
}

Result<std::string, TaskError> ResourceMonitor::export_metrics() const {
  nlohmann::json active = nlohmann::json::array();
  for (const auto &m : active_tasks()) {
    active.push_back(metrics_to_json(m));
  }
  nlohmann::json completed = nlohmann::json::array();
  for (const auto &m : completed_history()) {
    completed.push_back(metrics_to_json(m));
  }

  nlohmann::json doc;
  doc["timestamp"] = epoch_ms(TaskMetrics::WallClock::now());
  doc["current_metrics"] = snapshot_to_json(snapshot());
  doc["active_tasks"] = std::move(active);
  doc["completed_tasks"] = std::move(completed);
  doc["resource_limits"] = limits_to_json(limits());

  try {
    return Result<std::string, TaskError>::Ok(doc.dump(2));
  } catch (const nlohmann::json::exception &e) {
    return Result<std::string, TaskError>::Err(
        TaskError::Internal(std::string("Failed to export metrics: ") + e.what()));
  }
}

std::string ResourceMonitor::recommendation_for(const SystemSnapshot &snapshot,
                                                const ResourceLimits &limits) {
  if (snapshot.cpu_percent > limits.max_cpu_percent) {
    return "High CPU usage detected. Consider reducing concurrent tasks or "
           "enabling background processing.";
  }
  if (snapshot.memory_ratio() > 0.85) {
    return "High memory usage detected. Consider processing smaller batches "
           "or closing other applications.";
  }
  // Compare as "active + 1 > max" so max_concurrent_tasks == 0 cannot wrap.
  if (static_cast<std::uint64_t>(snapshot.active_tasks) + 1 >
      limits.max_concurrent_tasks) {
    return "Near maximum concurrent task limit. New tasks may be queued.";
  }
  return "System resources are operating within normal limits.";
}

std::string ResourceMonitor::recommendation() const {
  return recommendation_for(snapshot(), limits());
}

ResourceLimits ResourceMonitor::limits() const {
  std::lock_guard<std::mutex> lock(limits_mutex_);
  return limits_;
}

void ResourceMonitor::set_limits(ResourceLimits limits) {
  {
    std::lock_guard<std::mutex> lock(limits_mutex_);
    limits_ = limits;
  }
  log_info("monitor", "limits_changed",
           "max_memory_mb=" + std::to_string(limits.max_memory_mb) +
               " max_concurrent_tasks=" +
               std::to_string(limits.max_concurrent_tasks) +
               " task_timeout_seconds=" +
               std::to_string(limits.task_timeout_seconds));
}

void ResourceMonitor::optimize_for_low_memory() {
  set_limits(low_memory_preset(limits()));
  log_info("monitor", "optimize", "Configured for low memory usage");
}

void ResourceMonitor::optimize_for_performance() {
  std::uint64_t total_bytes = 0;
  unsigned cores = 0;
  if (probe_) {
    std::lock_guard<std::mutex> lock(probe_mutex_);
    total_bytes = probe_->memory_total_bytes();
    cores = probe_->cpu_count();
  }
  if (cores == 0) {
    cores = std::max(1U, std::thread::hardware_concurrency());
  }

  // Up to half of physical memory, never below the default ceiling.
  const std::uint64_t total_gb = total_bytes / kBytesPerGb;
  ResourceLimits next = limits();
  next.max_memory_mb = std::max<std::uint64_t>(total_gb * 512, 2048);
  next.max_concurrent_tasks = cores;
  set_limits(next);
  log_info("monitor", "optimize", "Configured for maximum performance");
}

void ResourceMonitor::optimize_balanced() {
  set_limits(ResourceLimits{});
  log_info("monitor", "optimize", "Configured with balanced settings");
}

std::size_t ResourceMonitor::cleanup_old_metrics(std::optional<std::size_t> keep) {
  const std::size_t limit = keep.value_or(config_.history_cap);
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    while (history_.size() > limit) {
      history_.pop_front();
      ++dropped;
    }
    std::lock_guard<std::mutex> snap_lock(snapshot_mutex_);
    snapshot_.completed_tasks = static_cast<std::uint32_t>(history_.size());
  }
  if (dropped > 0) {
    log_info("monitor", "metrics_cleanup",
             "dropped=" + std::to_string(dropped) +
                 " kept=" + std::to_string(limit));
  }
  return dropped;
}

void ResourceMonitor::log_info(const std::string &trace, const std::string &event,
                               const std::string &msg) const {
  if (logger_) {
    logger_->info(trace, "resource_monitor", event, msg);
  }
}

void ResourceMonitor::log_warn(const std::string &trace, const std::string &event,
                               const std::string &msg) const {
  if (logger_) {
    logger_->warn(trace, "resource_monitor", event, msg);
  }
}

} // namespace bgt::core
