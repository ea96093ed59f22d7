#pragma once

#include "core/task.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bgt::core {

/// One waiting task, as the queue sees it.
struct PendingEntry {
  std::string task_id;
  TaskPriority priority = TaskPriority::Normal;
  TaskKind kind = TaskKind::TextProcessing;
  std::uint64_t sequence = 0; // Arrival order, assigned by push()
};

/// Max-heap of pending tasks keyed by (priority, -sequence):
/// the highest priority comes out first, and among equal priorities the
/// earliest submission does.
///
/// Not thread-safe. TaskEngine guards it with its queue mutex and keeps that
/// mutex held while it writes the popped task's Running status, so no
/// observer sees a task that is neither queued nor running.
class PendingQueue {
public:
  /// Enqueue a new task; returns the sequence number it was given.
  std::uint64_t push(std::string task_id, TaskPriority priority, TaskKind kind);

  [[nodiscard]] std::optional<PendingEntry> peek() const;

  std::optional<PendingEntry> pop();

  /// Drop a task from the queue. Returns false if it was not queued.
  bool remove(const std::string &task_id);

  [[nodiscard]] std::size_t size() const { return heap_.size(); }
  [[nodiscard]] bool empty() const { return heap_.empty(); }

private:
  static bool lower_than(const PendingEntry &lhs, const PendingEntry &rhs);

  std::vector<PendingEntry> heap_;
  std::uint64_t next_sequence_ = 0;
};

} // namespace bgt::core
