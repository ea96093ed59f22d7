#include "core/task.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace bgt::core {

namespace {

constexpr std::array<const char *, kTaskKindCount> kKindNames = {
    "web_scraping",          "text_processing",
    "chunk_generation",      "export",
    "metadata_enrichment",   "visual_asset_download",
    "cloud_sync",            "backup",
    "quality_analysis",      "batch_processing",
    "advanced_chunking",     "quality_assessment",
    "relationship_extraction", "python_package_install"};

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

const char *to_string(TaskStatus status) {
  switch (status) {
  case TaskStatus::Queued:
    return "Queued";
  case TaskStatus::Running:
    return "Running";
  case TaskStatus::Completed:
    return "Completed";
  case TaskStatus::Failed:
    return "Failed";
  case TaskStatus::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

bool is_terminal(TaskStatus status) {
  switch (status) {
  case TaskStatus::Completed:
  case TaskStatus::Failed:
  case TaskStatus::Cancelled:
    return true;
  default:
    return false;
  }
}

const char *to_string(TaskPriority priority) {
  switch (priority) {
  case TaskPriority::Low:
    return "low";
  case TaskPriority::Normal:
    return "normal";
  case TaskPriority::High:
    return "high";
  case TaskPriority::Critical:
    return "critical";
  }
  return "unknown";
}

std::optional<TaskPriority> parse_task_priority(const std::string &name) {
  const auto key = lowercase(name);
  if (key == "low") {
    return TaskPriority::Low;
  }
  if (key == "normal") {
    return TaskPriority::Normal;
  }
  if (key == "high") {
    return TaskPriority::High;
  }
  if (key == "critical") {
    return TaskPriority::Critical;
  }
  return std::nullopt;
}

const char *to_string(TaskKind kind) {
  const auto index = static_cast<std::size_t>(kind);
  return index < kKindNames.size() ? kKindNames[index] : "unknown";
}

std::optional<TaskKind> parse_task_kind(const std::string &name) {
  const auto key = lowercase(name);
  for (std::size_t i = 0; i < kKindNames.size(); ++i) {
    if (key == kKindNames[i]) {
      return static_cast<TaskKind>(i);
    }
  }
  return std::nullopt;
}

Result<void, TaskError> Task::transition_to(TaskStatus next) {
  bool legal = false;

  switch (status) {
  case TaskStatus::Queued:
    legal = (next == TaskStatus::Running || next == TaskStatus::Cancelled);
    break;
  case TaskStatus::Running:
    legal = (next == TaskStatus::Completed || next == TaskStatus::Failed ||
             next == TaskStatus::Cancelled);
    break;
  case TaskStatus::Completed:
  case TaskStatus::Failed:
  case TaskStatus::Cancelled:
    legal = false;
    break;
  }

  if (!legal) {
    return Result<void, TaskError>::Err(TaskError::Internal(
        std::string("Illegal status transition: ") + to_string(status) +
        " -> " + to_string(next) + " (task_id=" + id + ")"));
  }

  status = next;
  if (next == TaskStatus::Running && !started_at.has_value()) {
    started_at = Clock::now();
  }
  if (core::is_terminal(next)) {
    completed_at = Clock::now();
  }
  return Result<void, TaskError>::Ok();
}

void Task::set_progress(float p) { progress = std::clamp(p, 0.0f, 100.0f); }

} // namespace bgt::core
