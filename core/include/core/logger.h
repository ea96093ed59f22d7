#pragma once

#include <string>

namespace bgt::core {

/// Logger interface used by the engine and the resource monitor.
/// Concrete implementations live in infra. Every component accepts a null
/// logger, which disables logging (tests rely on this).
///
/// trace_id is the task id when the record concerns one task, otherwise a
/// fixed scope name such as "engine" or "monitor".
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void debug(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace bgt::core
