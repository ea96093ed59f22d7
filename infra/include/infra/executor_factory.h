#pragma once

#include "core/executor.h"
#include "core/logger.h"
#include "core/result.h"
#include "core/task_error.h"
#include "infra/config.h"
#include "infra/executors.h"

#include <memory>
#include <string>
#include <utility>

namespace bgt::infra {

/// Builds the kind -> executor table for the configured mode.
/// "simulated" binds every kind to a SimulatedExecutor; "process" binds
/// every kind to a ProcessExecutor running the per-kind script.
class ExecutorFactory {
public:
  explicit ExecutorFactory(ExecutorSettings settings,
                           std::shared_ptr<core::ILogger> logger = nullptr)
      : settings_(std::move(settings)), logger_(std::move(logger)) {}

  core::Result<core::ExecutorTable, core::TaskError> build_table() const {
    auto executor = create_executor();
    if (!executor) {
      return core::Result<core::ExecutorTable, core::TaskError>::Err(
          core::TaskError::Submission("Unknown executor mode: " + settings_.mode));
    }
    core::ExecutorTable table;
    table.bind_all(executor);
    return core::Result<core::ExecutorTable, core::TaskError>::Ok(std::move(table));
  }

  std::shared_ptr<core::ITaskExecutor> create_executor() const {
    if (settings_.mode == "simulated") {
      return std::make_shared<SimulatedExecutor>(settings_.step_delay);
    }
    if (settings_.mode == "process") {
      ProcessOptions options;
      options.interpreter = settings_.interpreter;
      options.script_dir = settings_.script_dir.empty()
                               ? XdgPaths::script_dir().string()
                               : settings_.script_dir;
      return std::make_shared<ProcessExecutor>(std::move(options), logger_);
    }
    return nullptr;
  }

private:
  ExecutorSettings settings_;
  std::shared_ptr<core::ILogger> logger_;
};

} // namespace bgt::infra
