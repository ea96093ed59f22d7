#pragma once

#include "core/cancel_token.h"
#include "core/result.h"
#include "core/task.h"
#include "core/task_error.h"

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace bgt::core {

/// Context handed to an executor for one task run.
struct ExecutionContext {
  std::string task_id;
  TaskKind kind = TaskKind::TextProcessing;
  Metadata metadata;
  std::shared_ptr<CancelToken> cancel_token;

  /// Progress sink; the engine routes it to the progress channel.
  /// Parameters: progress [0, 100], step message, optional metadata patch.
  using ProgressFn = std::function<void(float, const std::string &,
                                        const std::optional<Metadata> &)>;
  ProgressFn on_progress;

  void emit(float progress, const std::string &message,
            const std::optional<Metadata> &patch = std::nullopt) const {
    if (on_progress) {
      on_progress(progress, message, patch);
    }
  }

  [[nodiscard]] bool is_canceled() const {
    return cancel_token && cancel_token->is_canceled();
  }

  /// Metadata lookup with fallback.
  [[nodiscard]] std::string get(const std::string &key,
                                const std::string &fallback = {}) const {
    auto it = metadata.find(key);
    return it == metadata.end() ? fallback : it->second;
  }
};

/// Adapter to the external payload executor for one or more task kinds.
///
/// Implementations must poll the cancel token between sub-steps and return
/// TaskError::Canceled once it fires. Exceptions are caught by the engine and
/// turned into an Execution failure, but adapters should return Err instead.
class ITaskExecutor {
public:
  virtual ~ITaskExecutor() = default;

  [[nodiscard]] virtual std::string name() const = 0;

  virtual Result<void, TaskError> execute(ExecutionContext &ctx) = 0;
};

/// Dispatch table: one executor slot per TaskKind.
/// Filled before the engine starts and read-only afterwards.
class ExecutorTable {
public:
  void bind(TaskKind kind, std::shared_ptr<ITaskExecutor> executor) {
    table_[static_cast<std::size_t>(kind)] = std::move(executor);
  }

  void bind_all(const std::shared_ptr<ITaskExecutor> &executor) {
    table_.fill(executor);
  }

  [[nodiscard]] std::shared_ptr<ITaskExecutor> find(TaskKind kind) const {
    return table_[static_cast<std::size_t>(kind)];
  }

private:
  std::array<std::shared_ptr<ITaskExecutor>, kTaskKindCount> table_{};
};

} // namespace bgt::core
