#include "core/pending_queue.h"

#include <algorithm>
#include <utility>

namespace bgt::core {

bool PendingQueue::lower_than(const PendingEntry &lhs, const PendingEntry &rhs) {
  if (lhs.priority != rhs.priority) {
    return static_cast<int>(lhs.priority) < static_cast<int>(rhs.priority);
  }
  // Later arrival ranks lower so std::pop_heap yields the earliest first.
  return lhs.sequence > rhs.sequence;
}

std::uint64_t PendingQueue::push(std::string task_id, TaskPriority priority,
                                 TaskKind kind) {
  PendingEntry entry;
  entry.task_id = std::move(task_id);
  entry.priority = priority;
  entry.kind = kind;
  entry.sequence = next_sequence_++;
  const auto seq = entry.sequence;

  heap_.push_back(std::move(entry));
  std::push_heap(heap_.begin(), heap_.end(), &PendingQueue::lower_than);
  return seq;
}

std::optional<PendingEntry> PendingQueue::peek() const {
  if (heap_.empty()) {
    return std::nullopt;
  }
  return heap_.front();
}

std::optional<PendingEntry> PendingQueue::pop() {
  if (heap_.empty()) {
    return std::nullopt;
  }
  std::pop_heap(heap_.begin(), heap_.end(), &PendingQueue::lower_than);
  PendingEntry top = std::move(heap_.back());
  heap_.pop_back();
  return top;
}

bool PendingQueue::remove(const std::string &task_id) {
  auto it = std::find_if(heap_.begin(), heap_.end(),
                         [&](const PendingEntry &e) { return e.task_id == task_id; });
  if (it == heap_.end()) {
    return false;
  }
  heap_.erase(it);
  std::make_heap(heap_.begin(), heap_.end(), &PendingQueue::lower_than);
  return true;
}

} // namespace bgt::core
