#include "core/task_registry.h"

#include <algorithm>
#include <utility>

namespace bgt::core {

namespace {

void sort_by_creation(std::vector<Task> &tasks) {
  std::sort(tasks.begin(), tasks.end(), [](const Task &a, const Task &b) {
    if (a.created_at != b.created_at) {
      return a.created_at < b.created_at;
    }
    return a.id < b.id;
  });
}

} // namespace

Result<void, TaskError> TaskRegistry::insert(Task task) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (tasks_.find(task.id) != tasks_.end()) {
    return Result<void, TaskError>::Err(
        TaskError::Internal("Duplicate task_id: " + task.id));
  }
  std::string id = task.id;
  tasks_.emplace(std::move(id), std::move(task));
  return Result<void, TaskError>::Ok();
}

std::optional<Task> TaskRegistry::get(const std::string &task_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool TaskRegistry::contains(const std::string &task_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return tasks_.find(task_id) != tasks_.end();
}

std::vector<Task> TaskRegistry::all() const {
  std::vector<Task> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(tasks_.size());
    for (const auto &[_, task] : tasks_) {
      out.push_back(task);
    }
  }
  sort_by_creation(out);
  return out;
}

std::vector<Task> TaskRegistry::with_status(TaskStatus status) const {
  std::vector<Task> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto &[_, task] : tasks_) {
      if (task.status == status) {
        out.push_back(task);
      }
    }
  }
  sort_by_creation(out);
  return out;
}

StatusCounts TaskRegistry::counts() const {
  StatusCounts c;
  std::shared_lock<std::shared_mutex> lock(mutex_);
  c.total = tasks_.size();
  for (const auto &[_, task] : tasks_) {
    switch (task.status) {
    case TaskStatus::Queued:
      ++c.queued;
      break;
    case TaskStatus::Running:
      ++c.running;
      break;
    case TaskStatus::Completed:
      ++c.completed;
      break;
    case TaskStatus::Failed:
      ++c.failed;
      break;
    case TaskStatus::Cancelled:
      ++c.cancelled;
      break;
    }
  }
  return c;
}

std::size_t TaskRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return tasks_.size();
}

} // namespace bgt::core
