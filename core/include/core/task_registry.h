#pragma once

#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"

#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace bgt::core {

/// Per-status tally of the registry, taken under one shared lock.
struct StatusCounts {
  std::size_t total = 0;
  std::size_t queued = 0;
  std::size_t running = 0;
  std::size_t completed = 0;
  std::size_t failed = 0;
  std::size_t cancelled = 0;
};

/// Authoritative task-id -> Task map.
///
/// Reads take a shared lock and return copies; writes take the exclusive
/// lock only for the in-memory mutation. Nothing here ever calls out to an
/// executor, so no lock is held across external work.
class TaskRegistry {
public:
  /// Fails with Internal if the id is already present.
  Result<void, TaskError> insert(Task task);

  [[nodiscard]] std::optional<Task> get(const std::string &task_id) const;

  [[nodiscard]] bool contains(const std::string &task_id) const;

  /// All tasks, oldest submission first.
  [[nodiscard]] std::vector<Task> all() const;

  [[nodiscard]] std::vector<Task> with_status(TaskStatus status) const;

  [[nodiscard]] StatusCounts counts() const;

  [[nodiscard]] std::size_t size() const;

  /// Run `fn(Task&)` on the entry under the exclusive lock.
  /// Returns false (and does not call fn) if the id is unknown.
  template <typename Fn> bool update(const std::string &task_id, Fn &&fn) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
      return false;
    }
    fn(it->second);
    return true;
  }

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Task> tasks_;
};

} // namespace bgt::core
