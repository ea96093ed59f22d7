#pragma once

#include "core/executor.h"
#include "core/logger.h"
#include "core/task.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bgt::infra {

/// One named sub-step of a simulated payload.
struct SimulatedStep {
  float progress;
  const char *message;
};

/// Sub-step table replayed for `kind`.
const std::vector<SimulatedStep> &simulated_steps(core::TaskKind kind);

/// Default pause after each sub-step of `kind`.
std::chrono::milliseconds default_step_delay(core::TaskKind kind);

/// SimulatedExecutor - replays a fixed sequence of progress steps per kind.
/// Stands in for the external payload runtime in demos and tests.
class SimulatedExecutor : public core::ITaskExecutor {
public:
  /// `step_delay` overrides the per-kind pacing when set.
  explicit SimulatedExecutor(
      std::optional<std::chrono::milliseconds> step_delay = std::nullopt);

  [[nodiscard]] std::string name() const override { return "SimulatedExecutor"; }

  core::Result<void, core::TaskError> execute(core::ExecutionContext &ctx) override;

private:
  std::optional<std::chrono::milliseconds> step_delay_;
};

struct ProcessOptions {
  std::string interpreter = "python3";
  std::string script_dir;
  std::string script_extension = ".py";
  /// Grace period between SIGTERM and SIGKILL once the token fires.
  std::chrono::milliseconds kill_grace{2000};
};

/// ProcessExecutor - runs `<interpreter> <script_dir>/<kind><ext>`.
///
/// The child sees its metadata as BGT_META_<KEY> (key upper-cased, other
/// characters than [A-Z0-9] mapped to '_') plus BGT_TASK_ID and
/// BGT_TASK_KIND. Stdout lines of the form `PROGRESS <pct> <message>` are
/// forwarded as progress; other lines are logged at debug level. Exit status
/// 0 is success; otherwise the last non-empty stderr line becomes the error.
/// The child receives SIGTERM when the task is cancelled.
class ProcessExecutor : public core::ITaskExecutor {
public:
  explicit ProcessExecutor(ProcessOptions options,
                           std::shared_ptr<core::ILogger> logger = nullptr);

  [[nodiscard]] std::string name() const override { return "ProcessExecutor"; }

  core::Result<void, core::TaskError> execute(core::ExecutionContext &ctx) override;

  [[nodiscard]] std::string script_path(core::TaskKind kind) const;

  /// "max_pages" -> "BGT_META_MAX_PAGES"
  static std::string env_name(const std::string &metadata_key);

  /// Parses a `PROGRESS <pct> <message>` line. Returns false for any other
  /// line.
  static bool parse_progress_line(const std::string &line, float &progress,
                                  std::string &message);

private:
  ProcessOptions options_;
  std::shared_ptr<core::ILogger> logger_;
};

} // namespace bgt::infra
