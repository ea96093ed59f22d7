#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>

namespace bgt::infra {

namespace {

spdlog::level::level_enum resolve_level(const std::string &requested) {
  std::string name = requested;
  if (name.empty()) {
    const char *env = std::getenv("BGT_LOG_LEVEL");
    name = env ? env : "";
  }
  if (name.empty()) {
    return spdlog::level::info;
  }
  // from_str maps unknown names to off; treat those as info instead.
  const auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return spdlog::level::info;
  }
  return level;
}

/// Writes `[trace_id] [component] event: msg` through the shared "bgt"
/// spdlog logger; the timestamp and level come from the sink pattern.
class ConsoleLogger : public core::ILogger {
public:
  explicit ConsoleLogger(spdlog::level::level_enum level) {
    logger_ = spdlog::get("bgt");
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt("bgt");
    }
    logger_->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v");
    logger_->set_level(level);
  }

  void debug(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    write(spdlog::level::debug, trace_id, component, event, msg);
  }

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    write(spdlog::level::info, trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    write(spdlog::level::warn, trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    write(spdlog::level::err, trace_id, component, event, msg);
  }

private:
  void write(spdlog::level::level_enum level, const std::string &trace_id,
             const std::string &component, const std::string &event,
             const std::string &msg) {
    if (!logger_->should_log(level)) {
      return;
    }
    logger_->log(level, "[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

std::unique_ptr<core::ILogger> create_console_logger(const std::string &level) {
  return std::make_unique<ConsoleLogger>(resolve_level(level));
}

} // namespace bgt::infra
