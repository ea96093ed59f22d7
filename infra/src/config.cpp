#include "infra/config.h"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace bgt::infra {

namespace {

std::filesystem::path home_dir() {
  const char *home = std::getenv("HOME");
  if (home != nullptr && home[0] != '\0') {
    return home;
  }
  passwd *pw = getpwuid(getuid());
  if (pw != nullptr && pw->pw_dir != nullptr) {
    return pw->pw_dir;
  }
  return "/tmp";
}

std::filesystem::path xdg_base(const char *variable,
                               const std::filesystem::path &fallback) {
  const char *value = std::getenv(variable);
  if (value != nullptr && value[0] != '\0') {
    return value;
  }
  return home_dir() / fallback;
}

void warn_invalid(const std::shared_ptr<core::ILogger> &logger, const char *name,
                  const char *raw, const std::string &fallback) {
  if (logger) {
    logger->warn("startup", "config", "config_invalid",
                 std::string("Invalid value for ") + name + "=" + raw +
                     ", fallback=" + fallback);
  }
}

std::string env_or(const char *name, const std::string &fallback) {
  const char *raw = std::getenv(name);
  return raw != nullptr && raw[0] != '\0' ? std::string(raw) : fallback;
}

} // namespace

std::filesystem::path XdgPaths::data_dir() {
  return xdg_base("XDG_DATA_HOME", std::filesystem::path(".local") / "share") /
         "bgtasks";
}

std::filesystem::path XdgPaths::script_dir() { return data_dir() / "scripts"; }

long long parse_env_int(const char *name, long long fallback, bool allow_zero,
                        const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  char *end = nullptr;
  const long long value = std::strtoll(raw, &end, 10);
  const bool valid = end && *end == 0 && (allow_zero ? value >= 0 : value > 0);
  if (!valid) {
    warn_invalid(logger, name, raw, std::to_string(fallback));
    return fallback;
  }
  return value;
}

double parse_env_double(const char *name, double fallback,
                        const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  char *end = nullptr;
  const double value = std::strtod(raw, &end);
  if (!(end && *end == 0 && value > 0.0)) {
    warn_invalid(logger, name, raw, std::to_string(fallback));
    return fallback;
  }
  return value;
}

AppConfig AppConfig::from_environment(const std::shared_ptr<core::ILogger> &logger) {
  AppConfig config;

  // BGT_MAX_WORKERS=0 selects the hardware-derived worker count.
  config.engine.max_workers = static_cast<int>(
      parse_env_int("BGT_MAX_WORKERS", config.engine.max_workers, true, logger));
  config.engine.tick_interval = std::chrono::milliseconds(parse_env_int(
      "BGT_TICK_MS", config.engine.tick_interval.count(), false, logger));

  config.monitor.sample_interval = std::chrono::milliseconds(parse_env_int(
      "BGT_SAMPLE_MS", config.monitor.sample_interval.count(), false, logger));
  config.monitor.history_cap = static_cast<std::size_t>(parse_env_int(
      "BGT_HISTORY_CAP", static_cast<long long>(config.monitor.history_cap),
      false, logger));

  auto &limits = config.monitor.limits;
  limits.max_memory_mb = static_cast<std::uint64_t>(parse_env_int(
      "BGT_MAX_MEMORY_MB", static_cast<long long>(limits.max_memory_mb), false,
      logger));
  limits.max_cpu_percent =
      parse_env_double("BGT_MAX_CPU_PERCENT", limits.max_cpu_percent, logger);
  limits.max_concurrent_tasks = static_cast<std::uint32_t>(parse_env_int(
      "BGT_MAX_CONCURRENT", limits.max_concurrent_tasks, false, logger));
  limits.task_timeout_seconds = static_cast<std::uint64_t>(parse_env_int(
      "BGT_TASK_TIMEOUT_S", static_cast<long long>(limits.task_timeout_seconds),
      true, logger));

  auto &exec = config.executor;
  const std::string mode = env_or("BGT_EXECUTOR", exec.mode);
  if (mode == "simulated" || mode == "process") {
    exec.mode = mode;
  } else {
    warn_invalid(logger, "BGT_EXECUTOR", mode.c_str(), exec.mode);
  }
  exec.interpreter = env_or("BGT_INTERPRETER", exec.interpreter);
  exec.script_dir = env_or("BGT_SCRIPT_DIR", XdgPaths::script_dir().string());
  const long long step_ms = parse_env_int("BGT_STEP_MS", -1, true, logger);
  if (step_ms >= 0) {
    exec.step_delay = std::chrono::milliseconds(step_ms);
  }

  return config;
}

} // namespace bgt::infra
