#pragma once

#include "core/logger.h"
#include "core/resource_monitor.h"
#include "core/task_engine.h"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace bgt::infra {

/// XDG Base Directory paths for bgtasks.
/// See https://specifications.freedesktop.org/basedir-spec/basedir-spec-latest.html
class XdgPaths {
public:
  /// $XDG_DATA_HOME/bgtasks, or ~/.local/share/bgtasks
  static std::filesystem::path data_dir();

  /// Default location of the per-kind executor scripts: data_dir()/scripts
  static std::filesystem::path script_dir();
};

/// How task payloads are executed.
struct ExecutorSettings {
  std::string mode = "simulated"; // "simulated" | "process"
  std::string interpreter = "python3";
  std::string script_dir;                       // Empty: XdgPaths::script_dir()
  std::optional<std::chrono::milliseconds> step_delay; // Unset: per-kind pacing
};

/// Process-wide configuration assembled from BGT_* environment variables.
struct AppConfig {
  core::EngineConfig engine;
  core::MonitorConfig monitor;
  ExecutorSettings executor;

  /// Invalid values are logged as warnings and replaced by the default.
  static AppConfig from_environment(const std::shared_ptr<core::ILogger> &logger);
};

/// Reads an integer variable. Unset or empty returns `fallback`; a value
/// that does not parse, or is negative (or zero unless `allow_zero`), logs a
/// warning and returns `fallback`.
long long parse_env_int(const char *name, long long fallback, bool allow_zero,
                        const std::shared_ptr<core::ILogger> &logger);

/// Same contract as parse_env_int for a positive decimal.
double parse_env_double(const char *name, double fallback,
                        const std::shared_ptr<core::ILogger> &logger);

} // namespace bgt::infra
