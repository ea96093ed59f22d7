#include "core/task_engine.h"

#include "core/cancel_token.h"
#include "core/channel.h"
#include "core/commands.h"
#include "core/logger.h"
#include "core/pending_queue.h"
#include "core/task_registry.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bgt::core {
namespace {

constexpr std::size_t kMaxMetadataFieldBytes = 4096;

int clamp_auto_workers() {
  const auto hw = static_cast<int>(std::thread::hardware_concurrency());
  if (hw <= 0) {
    return 4;
  }
  return std::clamp(hw - 1, 2, 8);
}

std::string generate_uuid() {
  thread_local std::mt19937_64 gen{std::random_device{}()};
  std::uniform_int_distribution<std::uint64_t> dis;

  std::uint64_t hi = dis(gen);
  std::uint64_t lo = dis(gen);
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant

  std::ostringstream ss;
  ss << std::hex << std::setfill('0') << std::setw(8) << (hi >> 32) << '-'
     << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-' << std::setw(4)
     << (hi & 0xFFFF) << '-' << std::setw(4) << (lo >> 48) << '-'
     << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
  return ss.str();
}

std::optional<TaskError> validate_metadata(const Metadata &metadata) {
  for (const auto &[key, value] : metadata) {
    if (key.empty()) {
      return TaskError::Submission("Metadata keys must not be empty");
    }
    if (key.size() > kMaxMetadataFieldBytes ||
        value.size() > kMaxMetadataFieldBytes) {
      return TaskError(ErrorCategory::Submission, 1002, false,
                       "Metadata field too large",
                       "metadata key/value exceeds " +
                           std::to_string(kMaxMetadataFieldBytes) + " bytes",
                       {{"key", key.substr(0, 64)}});
    }
  }
  return std::nullopt;
}

std::string format_percent(float value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << value;
  return oss.str();
}

/// A task handed from the admission loop to a worker.
struct Dispatch {
  std::string task_id;
  TaskKind kind = TaskKind::TextProcessing;
  Metadata metadata;
  std::shared_ptr<CancelToken> cancel_token;
};

class TaskEngine final : public ITaskEngine {
public:
  TaskEngine(EngineConfig config, ExecutorTable executors,
             std::shared_ptr<ResourceMonitor> monitor,
             std::shared_ptr<ILogger> logger)
      : config_(normalize_config(config)), executors_(std::move(executors)),
        monitor_(std::move(monitor)), logger_(std::move(logger)) {
    command_thread_ = std::thread([this]() { command_loop(); });
    progress_thread_ = std::thread([this]() { progress_loop(); });

    workers_.reserve(static_cast<std::size_t>(config_.max_workers));
    for (int i = 0; i < config_.max_workers; ++i) {
      workers_.emplace_back([this]() { worker_loop(); });
    }

    admission_thread_ = std::thread([this]() { admission_loop(); });

    log_info("engine", "engine_started",
             "max_workers=" + std::to_string(config_.max_workers) +
                 " tick_ms=" + std::to_string(config_.tick_interval.count()));
  }

  ~TaskEngine() override {
    shutdown();

    if (admission_thread_.joinable()) {
      admission_thread_.join();
    }

    // Commands first: pending cancels must land before workers finalize.
    commands_.close();
    if (command_thread_.joinable()) {
      command_thread_.join();
    }

    {
      std::lock_guard<std::mutex> lock(dispatch_mutex_);
      pool_stopping_ = true;
    }
    dispatch_cv_.notify_all();
    for (auto &w : workers_) {
      if (w.joinable()) {
        w.join();
      }
    }

    progress_.close();
    if (progress_thread_.joinable()) {
      progress_thread_.join();
    }
  }

  Result<std::string, TaskError> submit(TaskKind kind, TaskPriority priority,
                                        Metadata metadata) override {
    if (shutdown_.load(std::memory_order_acquire)) {
      return Result<std::string, TaskError>::Err(
          TaskError::Submission("Engine is shut down"));
    }
    if (auto invalid = validate_metadata(metadata)) {
      return Result<std::string, TaskError>::Err(std::move(*invalid));
    }

    Task task;
    task.id = generate_uuid();
    task.kind = kind;
    task.priority = priority;
    task.metadata = std::move(metadata);
    const std::string id = task.id;

    {
      std::lock_guard<std::mutex> lock(tokens_mutex_);
      tokens_[id] = CancelToken::create();
    }

    {
      // Registry insert and enqueue under one queue lock, so a concurrent
      // cancel either sees the task in both places or in neither.
      std::lock_guard<std::mutex> lock(queue_mutex_);
      auto inserted = registry_.insert(std::move(task));
      if (inserted.is_err()) {
        release_token(id);
        return Result<std::string, TaskError>::Err(inserted.error());
      }
      queue_.push(id, priority, kind);
    }

    log_info(id, "task_submitted",
             std::string("kind=") + to_string(kind) +
                 " priority=" + to_string(priority));
    return Result<std::string, TaskError>::Ok(id);
  }

  Result<void, TaskError> cancel(const std::string &task_id) override {
    return send_command(task_id, CancelCommand{task_id, CancelReason::User});
  }

  Result<void, TaskError> pause(const std::string &task_id) override {
    return send_command(task_id, PauseCommand{task_id});
  }

  Result<void, TaskError> resume(const std::string &task_id) override {
    return send_command(task_id, ResumeCommand{task_id});
  }

  Result<void, TaskError> request_status(const std::string &task_id) override {
    return send_command(task_id, StatusCommand{task_id});
  }

  void update_progress(const std::string &task_id, float progress,
                       const std::string &message) override {
    send_progress(task_id, progress, message, std::nullopt);
  }

  [[nodiscard]] std::optional<Task>
  get_status(const std::string &task_id) const override {
    return registry_.get(task_id);
  }

  [[nodiscard]] std::vector<Task> get_all() const override {
    return registry_.all();
  }

  [[nodiscard]] std::vector<Task> get_active() const override {
    return registry_.with_status(TaskStatus::Running);
  }

  [[nodiscard]] std::size_t queue_length() const override {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
  }

  [[nodiscard]] int active_workers() const override {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return active_workers_;
  }

  [[nodiscard]] int max_workers() const override { return config_.max_workers; }

  [[nodiscard]] SystemStats system_stats() const override {
    const StatusCounts counts = registry_.counts();

    SystemStats stats;
    stats.total = counts.total;
    stats.completed = counts.completed;
    stats.failed = counts.failed;
    stats.cancelled = counts.cancelled;
    stats.running = counts.running;
    stats.queued = queue_length();
    stats.active_workers = active_workers();
    stats.max_workers = config_.max_workers;
    stats.success_rate =
        counts.total > 0 ? static_cast<double>(counts.completed) /
                               static_cast<double>(counts.total) * 100.0
                         : 0.0;
    return stats;
  }

  void shutdown() override {
    bool expected = false;
    if (!shutdown_.compare_exchange_strong(expected, true,
                                           std::memory_order_acq_rel)) {
      return;
    }
    log_info("engine", "shutdown", "Shutting down background task system");

    {
      std::lock_guard<std::mutex> lock(admission_mutex_);
    }
    admission_cv_.notify_all();

    // admit_next() re-checks shutdown_ under queue_mutex_, so every task it
    // moved to Running is visible here.
    std::vector<Task> running;
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      running = registry_.with_status(TaskStatus::Running);
    }
    for (const auto &task : running) {
      fire_token(task.id, CancelReason::Shutdown);
      if (!commands_.send(CancelCommand{task.id, CancelReason::Shutdown})) {
        log_warn(task.id, "command_dropped",
                 "Failed to send cancel command during shutdown");
      }
    }
  }

  [[nodiscard]] bool is_shut_down() const override {
    return shutdown_.load(std::memory_order_acquire);
  }

private:
  static EngineConfig normalize_config(EngineConfig config) {
    if (config.max_workers <= 0) {
      config.max_workers = clamp_auto_workers();
    }
    if (config.tick_interval.count() <= 0) {
      config.tick_interval = std::chrono::milliseconds(1000);
    }
    return config;
  }

  // ---- Command channel ----

  Result<void, TaskError> send_command(const std::string &task_id,
                                       TaskCommand command) {
    if (!registry_.contains(task_id)) {
      return Result<void, TaskError>::Err(TaskError::NotFound(task_id));
    }
    const std::string name = command_name(command);
    if (!commands_.send(std::move(command))) {
      log_warn(task_id, "command_dropped",
               "Failed to send " + name + " command: processor stopped");
      return Result<void, TaskError>::Err(TaskError::Channel(
          "Failed to send " + name + " command: processor stopped"));
    }
    return Result<void, TaskError>::Ok();
  }

  void command_loop() {
    while (auto command = commands_.receive()) {
      std::visit([this](const auto &cmd) { handle(cmd); }, *command);
    }
  }

  void handle(const CancelCommand &cmd) {
    bool was_queued = false;
    bool cancelled = false;
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      was_queued = queue_.remove(cmd.task_id);
      registry_.update(cmd.task_id, [&](Task &task) {
        if (task.is_terminal()) {
          return;
        }
        if (task.transition_to(TaskStatus::Cancelled).is_ok()) {
          task.message = "Task cancelled";
          task.error = TaskError::Canceled(
              std::string("Cancelled (") + to_string(cmd.reason) + ")");
          cancelled = true;
        }
      });
    }

    if (!cancelled) {
      log_debug(cmd.task_id, "cancel_ignored", "Task already terminal or unknown");
      return;
    }

    fire_token(cmd.task_id, cmd.reason);
    if (was_queued) {
      release_token(cmd.task_id);
    }
    if (monitor_) {
      monitor_->cancel_task(cmd.task_id);
    }
    log_info(cmd.task_id, "task_cancelled",
             std::string("reason=") + to_string(cmd.reason) +
                 (was_queued ? " (removed from queue)" : ""));
  }

  void handle(const PauseCommand &cmd) {
    const bool found = annotate(cmd.task_id, "Task paused");
    if (found) {
      log_info(cmd.task_id, "task_paused", "Task paused");
    }
  }

  void handle(const ResumeCommand &cmd) {
    const bool found = annotate(cmd.task_id, "Task resumed");
    if (found) {
      log_info(cmd.task_id, "task_resumed", "Task resumed");
    }
  }

  void handle(const StatusCommand &cmd) {
    auto task = registry_.get(cmd.task_id);
    if (!task) {
      return;
    }
    log_debug(cmd.task_id, "task_status",
              std::string(to_string(task->status)) + " " +
                  format_percent(task->progress) + "% - " + task->message);
  }

  bool annotate(const std::string &task_id, const std::string &message) {
    bool applied = false;
    registry_.update(task_id, [&](Task &task) {
      if (!task.is_terminal()) {
        task.message = message;
        applied = true;
      }
    });
    return applied;
  }

  // ---- Progress channel ----

  void send_progress(const std::string &task_id, float progress,
                     const std::string &message,
                     const std::optional<Metadata> &patch) {
    ProgressEvent event;
    event.task_id = task_id;
    event.progress = std::clamp(progress, 0.0f, 100.0f);
    event.message = message;
    event.metadata = patch;
    if (!progress_.send(std::move(event))) {
      log_warn(task_id, "progress_dropped", "Failed to send progress update");
    }
  }

  void progress_loop() {
    while (auto event = progress_.receive()) {
      bool applied = false;
      registry_.update(event->task_id, [&](Task &task) {
        // A late event must not rewrite a finished record.
        if (task.is_terminal()) {
          return;
        }
        task.set_progress(event->progress);
        task.message = event->message;
        if (event->metadata) {
          for (const auto &[key, value] : *event->metadata) {
            task.metadata[key] = value;
          }
        }
        applied = true;
      });
      if (applied) {
        log_debug(event->task_id, "progress",
                  format_percent(event->progress) + "% - " + event->message);
      }
    }
  }

  // ---- Admission ----

  void admission_loop() {
    while (true) {
      {
        std::unique_lock<std::mutex> lock(admission_mutex_);
        if (admission_cv_.wait_for(lock, config_.tick_interval, [this]() {
              return shutdown_.load(std::memory_order_acquire);
            })) {
          break;
        }
      }
      enforce_timeouts();
      admit_next();
    }
    log_info("engine", "scheduler_stopped", "Task scheduler shutting down");
  }

  void admit_next() {
    {
      std::lock_guard<std::mutex> lock(workers_mutex_);
      if (active_workers_ >= config_.max_workers) {
        return;
      }
    }

    Dispatch job;
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      if (shutdown_.load(std::memory_order_acquire)) {
        return;
      }
      std::optional<PendingEntry> next;
      while ((next = queue_.peek())) {
        auto current = registry_.get(next->task_id);
        if (current && current->status == TaskStatus::Queued) {
          job.metadata = current->metadata;
          break;
        }
        queue_.pop(); // Stale entry; cancel normally removes it.
      }
      if (!next) {
        return;
      }

      if (monitor_) {
        auto admitted = monitor_->start_task(next->task_id, to_string(next->kind));
        if (admitted.is_err()) {
          // Deferred: the task stays queued with its original sequence.
          if (last_deferred_ != next->task_id) {
            last_deferred_ = next->task_id;
            log_warn(next->task_id, "admission_deferred",
                     admitted.error().message);
          } else {
            log_debug(next->task_id, "admission_deferred",
                      admitted.error().message);
          }
          return;
        }
      }
      last_deferred_.clear();

      queue_.pop();
      bool running = false;
      registry_.update(next->task_id, [&](Task &task) {
        auto moved = task.transition_to(TaskStatus::Running);
        if (moved.is_ok()) {
          task.message = "Task started";
          running = true;
        } else {
          log_error(task.id, "admission_failed", moved.error().message);
        }
      });
      if (!running) {
        if (monitor_) {
          monitor_->cancel_task(next->task_id);
        }
        return;
      }

      {
        std::lock_guard<std::mutex> workers_lock(workers_mutex_);
        ++active_workers_;
      }

      job.task_id = next->task_id;
      job.kind = next->kind;
      job.cancel_token = token_for(next->task_id);
    }

    log_info(job.task_id, "task_admitted",
             std::string("kind=") + to_string(job.kind) +
                 " active_workers=" + std::to_string(active_workers()));

    {
      std::lock_guard<std::mutex> lock(dispatch_mutex_);
      dispatch_.push_back(std::move(job));
    }
    dispatch_cv_.notify_one();
  }

  void enforce_timeouts() {
    if (!monitor_) {
      return;
    }
    const auto timeout_s = monitor_->limits().task_timeout_seconds;
    if (timeout_s == 0) {
      return;
    }

    const auto limit = std::chrono::seconds(timeout_s);
    const auto now = Task::Clock::now();
    for (const auto &task : registry_.with_status(TaskStatus::Running)) {
      if (!task.started_at || now - *task.started_at < limit) {
        continue;
      }

      bool timed_out = false;
      registry_.update(task.id, [&](Task &entry) {
        if (entry.status != TaskStatus::Running) {
          return;
        }
        if (entry.transition_to(TaskStatus::Failed).is_ok()) {
          entry.message = "Task timed out";
          entry.error = TaskError::Timeout("Task timed out after " +
                                           std::to_string(timeout_s) + "s");
          timed_out = true;
        }
      });
      if (!timed_out) {
        continue;
      }

      fire_token(task.id, CancelReason::Timeout);
      monitor_->complete_task(task.id, false);
      log_warn(task.id, "task_timeout",
               "Exceeded " + std::to_string(timeout_s) + "s, cancellation requested");
    }
  }

  // ---- Workers ----

  void worker_loop() {
    while (true) {
      Dispatch job;
      {
        std::unique_lock<std::mutex> lock(dispatch_mutex_);
        dispatch_cv_.wait(lock, [this]() {
          return pool_stopping_ || !dispatch_.empty();
        });
        if (dispatch_.empty()) {
          return;
        }
        job = std::move(dispatch_.front());
        dispatch_.pop_front();
      }
      run(job);
    }
  }

  void run(Dispatch &job) {
    log_info(job.task_id, "task_started",
             std::string("Starting execution (") + to_string(job.kind) + ")");

    ExecutionContext ctx;
    ctx.task_id = job.task_id;
    ctx.kind = job.kind;
    ctx.metadata = job.metadata;
    ctx.cancel_token = job.cancel_token;
    const std::string task_id = job.task_id;
    ctx.on_progress = [this, task_id](float p, const std::string &msg,
                                      const std::optional<Metadata> &patch) {
      send_progress(task_id, p, msg, patch);
    };

    ctx.emit(0.0f, "Initializing task");

    auto result = execute(ctx);
    finalize(job, result);
  }

  Result<void, TaskError> execute(ExecutionContext &ctx) {
    auto executor = executors_.find(ctx.kind);
    if (!executor) {
      return Result<void, TaskError>::Err(TaskError::Execution(
          std::string("No executor bound for kind: ") + to_string(ctx.kind)));
    }
    if (ctx.is_canceled()) {
      return Result<void, TaskError>::Err(TaskError::Canceled());
    }

    try {
      return executor->execute(ctx);
    } catch (const std::exception &e) {
      return Result<void, TaskError>::Err(TaskError::Execution(
          executor->name() + " threw: " + e.what()));
    } catch (...) {
      return Result<void, TaskError>::Err(TaskError::Execution(
          executor->name() + " threw a non-standard exception"));
    }
  }

  void finalize(const Dispatch &job, const Result<void, TaskError> &result) {
    enum class Outcome { Skipped, Completed, Failed, Cancelled };
    Outcome outcome = Outcome::Skipped;

    registry_.update(job.task_id, [&](Task &task) {
      // Cancelled or timed out while running: keep that terminal status.
      if (task.is_terminal()) {
        return;
      }
      if (result.is_ok()) {
        if (task.transition_to(TaskStatus::Completed).is_ok()) {
          task.set_progress(100.0f);
          task.message = "Task completed successfully";
          outcome = Outcome::Completed;
        }
        return;
      }

      const bool canceled = result.error().category == ErrorCategory::Canceled;
      if (task.transition_to(canceled ? TaskStatus::Cancelled : TaskStatus::Failed)
              .is_ok()) {
        task.message = canceled ? "Task cancelled" : "Task failed";
        task.error = result.error();
        outcome = canceled ? Outcome::Cancelled : Outcome::Failed;
      }
    });

    if (monitor_) {
      switch (outcome) {
      case Outcome::Completed:
        monitor_->complete_task(job.task_id, true);
        break;
      case Outcome::Failed:
        monitor_->complete_task(job.task_id, false);
        break;
      case Outcome::Cancelled:
        monitor_->cancel_task(job.task_id);
        break;
      case Outcome::Skipped:
        break;
      }
    }

    release_token(job.task_id);

    {
      std::lock_guard<std::mutex> lock(workers_mutex_);
      if (active_workers_ > 0) {
        --active_workers_;
      } else {
        log_error(job.task_id, "worker_underflow",
                  "active_workers already zero at task completion");
      }
    }

    switch (outcome) {
    case Outcome::Completed:
      log_info(job.task_id, "task_completed", "Task completed successfully");
      break;
    case Outcome::Failed:
      log_error(job.task_id, "task_failed", result.error().message);
      break;
    case Outcome::Cancelled:
      log_info(job.task_id, "task_cancelled", "Executor observed cancellation");
      break;
    case Outcome::Skipped:
      log_debug(job.task_id, "result_discarded",
                "Task already terminal when executor returned");
      break;
    }
  }

  // ---- Cancel tokens ----

  std::shared_ptr<CancelToken> token_for(const std::string &task_id) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    auto &token = tokens_[task_id];
    if (!token) {
      token = CancelToken::create();
    }
    return token;
  }

  void fire_token(const std::string &task_id, CancelReason reason) {
    std::shared_ptr<CancelToken> token;
    {
      std::lock_guard<std::mutex> lock(tokens_mutex_);
      auto it = tokens_.find(task_id);
      if (it != tokens_.end()) {
        token = it->second;
      }
    }
    if (token) {
      token->request_cancel(reason);
    }
  }

  void release_token(const std::string &task_id) {
    std::lock_guard<std::mutex> lock(tokens_mutex_);
    tokens_.erase(task_id);
  }

  // ---- Logging ----

  void log_debug(const std::string &trace, const std::string &event,
                 const std::string &msg) const {
    if (logger_) {
      logger_->debug(trace, "task_engine", event, msg);
    }
  }

  void log_info(const std::string &trace, const std::string &event,
                const std::string &msg) const {
    if (logger_) {
      logger_->info(trace, "task_engine", event, msg);
    }
  }

  void log_warn(const std::string &trace, const std::string &event,
                const std::string &msg) const {
    if (logger_) {
      logger_->warn(trace, "task_engine", event, msg);
    }
  }

  void log_error(const std::string &trace, const std::string &event,
                 const std::string &msg) const {
    if (logger_) {
      logger_->error(trace, "task_engine", event, msg);
    }
  }

  const EngineConfig config_;
  const ExecutorTable executors_;
  std::shared_ptr<ResourceMonitor> monitor_;
  std::shared_ptr<ILogger> logger_;

  TaskRegistry registry_;

  mutable std::mutex queue_mutex_;
  PendingQueue queue_;
  std::string last_deferred_; // Guarded by queue_mutex_

  std::mutex tokens_mutex_;
  std::unordered_map<std::string, std::shared_ptr<CancelToken>> tokens_;

  Channel<TaskCommand> commands_;
  Channel<ProgressEvent> progress_;

  mutable std::mutex workers_mutex_;
  int active_workers_ = 0;

  std::mutex dispatch_mutex_;
  std::condition_variable dispatch_cv_;
  std::deque<Dispatch> dispatch_;
  bool pool_stopping_ = false;

  std::atomic<bool> shutdown_{false};
  std::mutex admission_mutex_;
  std::condition_variable admission_cv_;

  std::thread command_thread_;
  std::thread progress_thread_;
  std::thread admission_thread_;
  std::vector<std::thread> workers_;
};

} // namespace

std::unique_ptr<ITaskEngine>
create_task_engine(const EngineConfig &config, ExecutorTable executors,
                   std::shared_ptr<ResourceMonitor> monitor,
                   std::shared_ptr<ILogger> logger) {
  return std::make_unique<TaskEngine>(config, std::move(executors),
                                      std::move(monitor), std::move(logger));
}

} // namespace bgt::core
