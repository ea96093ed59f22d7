#include <gtest/gtest.h>

#include "infra/config.h"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using namespace bgt;
using namespace bgt::infra;

namespace {

/// Captures warn() calls so tests can assert on rejected values.
class RecordingLogger : public core::ILogger {
public:
  void debug(const std::string &, const std::string &, const std::string &,
             const std::string &) override {}
  void info(const std::string &, const std::string &, const std::string &,
            const std::string &) override {}
  void warn(const std::string &, const std::string &, const std::string &event,
            const std::string &msg) override {
    warnings.push_back(event + ": " + msg);
  }
  void error(const std::string &, const std::string &, const std::string &,
             const std::string &) override {}

  std::vector<std::string> warnings;
};

const char *const kVariables[] = {
    "BGT_MAX_WORKERS",   "BGT_TICK_MS",         "BGT_SAMPLE_MS",
    "BGT_HISTORY_CAP",   "BGT_MAX_MEMORY_MB",   "BGT_MAX_CPU_PERCENT",
    "BGT_MAX_CONCURRENT", "BGT_TASK_TIMEOUT_S", "BGT_EXECUTOR",
    "BGT_INTERPRETER",   "BGT_SCRIPT_DIR",      "BGT_STEP_MS",
    "XDG_DATA_HOME"};

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override { clear(); }
  void TearDown() override { clear(); }

  static void clear() {
    for (const char *name : kVariables) {
      ::unsetenv(name);
    }
  }

  std::shared_ptr<RecordingLogger> logger_ = std::make_shared<RecordingLogger>();
};

} // namespace

TEST_F(ConfigTest, DefaultsWhenUnset) {
  ::setenv("XDG_DATA_HOME", "/tmp/bgt-data", 1);
  const auto config = AppConfig::from_environment(logger_);

  EXPECT_EQ(config.engine.max_workers, 4);
  EXPECT_EQ(config.engine.tick_interval.count(), 1000);
  EXPECT_EQ(config.monitor.sample_interval.count(), 5000);
  EXPECT_EQ(config.monitor.history_cap, 1000u);
  EXPECT_EQ(config.monitor.limits.max_memory_mb, 2048u);
  EXPECT_DOUBLE_EQ(config.monitor.limits.max_cpu_percent, 80.0);
  EXPECT_EQ(config.monitor.limits.max_concurrent_tasks, 4u);
  EXPECT_EQ(config.monitor.limits.task_timeout_seconds, 1800u);
  EXPECT_EQ(config.executor.mode, "simulated");
  EXPECT_EQ(config.executor.interpreter, "python3");
  EXPECT_EQ(config.executor.script_dir, "/tmp/bgt-data/bgtasks/scripts");
  EXPECT_FALSE(config.executor.step_delay.has_value());
  EXPECT_TRUE(logger_->warnings.empty());
}

TEST_F(ConfigTest, ReadsOverrides) {
  ::setenv("BGT_MAX_WORKERS", "6", 1);
  ::setenv("BGT_TICK_MS", "250", 1);
  ::setenv("BGT_SAMPLE_MS", "2000", 1);
  ::setenv("BGT_HISTORY_CAP", "50", 1);
  ::setenv("BGT_MAX_MEMORY_MB", "4096", 1);
  ::setenv("BGT_MAX_CPU_PERCENT", "65.5", 1);
  ::setenv("BGT_MAX_CONCURRENT", "3", 1);
  ::setenv("BGT_TASK_TIMEOUT_S", "120", 1);
  ::setenv("BGT_EXECUTOR", "process", 1);
  ::setenv("BGT_INTERPRETER", "/usr/bin/python3.12", 1);
  ::setenv("BGT_SCRIPT_DIR", "/opt/bgt/scripts", 1);
  ::setenv("BGT_STEP_MS", "15", 1);

  const auto config = AppConfig::from_environment(logger_);
  EXPECT_EQ(config.engine.max_workers, 6);
  EXPECT_EQ(config.engine.tick_interval.count(), 250);
  EXPECT_EQ(config.monitor.sample_interval.count(), 2000);
  EXPECT_EQ(config.monitor.history_cap, 50u);
  EXPECT_EQ(config.monitor.limits.max_memory_mb, 4096u);
  EXPECT_DOUBLE_EQ(config.monitor.limits.max_cpu_percent, 65.5);
  EXPECT_EQ(config.monitor.limits.max_concurrent_tasks, 3u);
  EXPECT_EQ(config.monitor.limits.task_timeout_seconds, 120u);
  EXPECT_EQ(config.executor.mode, "process");
  EXPECT_EQ(config.executor.interpreter, "/usr/bin/python3.12");
  EXPECT_EQ(config.executor.script_dir, "/opt/bgt/scripts");
  ASSERT_TRUE(config.executor.step_delay.has_value());
  EXPECT_EQ(config.executor.step_delay->count(), 15);
  EXPECT_TRUE(logger_->warnings.empty());
}

TEST_F(ConfigTest, ZeroIsAllowedWhereItHasMeaning) {
  ::setenv("BGT_MAX_WORKERS", "0", 1);
  ::setenv("BGT_TASK_TIMEOUT_S", "0", 1);
  ::setenv("BGT_STEP_MS", "0", 1);

  const auto config = AppConfig::from_environment(logger_);
  EXPECT_EQ(config.engine.max_workers, 0);
  EXPECT_EQ(config.monitor.limits.task_timeout_seconds, 0u);
  ASSERT_TRUE(config.executor.step_delay.has_value());
  EXPECT_EQ(config.executor.step_delay->count(), 0);
  EXPECT_TRUE(logger_->warnings.empty());
}

TEST_F(ConfigTest, InvalidValuesFallBackWithWarning) {
  ::setenv("BGT_TICK_MS", "0", 1);
  ::setenv("BGT_MAX_CONCURRENT", "-2", 1);
  ::setenv("BGT_MAX_MEMORY_MB", "lots", 1);
  ::setenv("BGT_MAX_CPU_PERCENT", "80%", 1);
  ::setenv("BGT_EXECUTOR", "docker", 1);

  const auto config = AppConfig::from_environment(logger_);
  EXPECT_EQ(config.engine.tick_interval.count(), 1000);
  EXPECT_EQ(config.monitor.limits.max_concurrent_tasks, 4u);
  EXPECT_EQ(config.monitor.limits.max_memory_mb, 2048u);
  EXPECT_DOUBLE_EQ(config.monitor.limits.max_cpu_percent, 80.0);
  EXPECT_EQ(config.executor.mode, "simulated");
  ASSERT_EQ(logger_->warnings.size(), 5u);
  for (const auto &warning : logger_->warnings) {
    EXPECT_EQ(warning.rfind("config_invalid: Invalid value for BGT_", 0), 0u)
        << warning;
  }
}

TEST_F(ConfigTest, ParseEnvIntWithoutLogger) {
  ::setenv("BGT_TICK_MS", "12abc", 1);
  EXPECT_EQ(parse_env_int("BGT_TICK_MS", 99, false, nullptr), 99);
  ::setenv("BGT_TICK_MS", "", 1);
  EXPECT_EQ(parse_env_int("BGT_TICK_MS", 99, false, nullptr), 99);
  ::setenv("BGT_TICK_MS", "42", 1);
  EXPECT_EQ(parse_env_int("BGT_TICK_MS", 99, false, nullptr), 42);
}

TEST_F(ConfigTest, ParseEnvDouble) {
  ::setenv("BGT_MAX_CPU_PERCENT", "12.25", 1);
  EXPECT_DOUBLE_EQ(parse_env_double("BGT_MAX_CPU_PERCENT", 1.0, logger_), 12.25);
  ::setenv("BGT_MAX_CPU_PERCENT", "0", 1);
  EXPECT_DOUBLE_EQ(parse_env_double("BGT_MAX_CPU_PERCENT", 1.0, logger_), 1.0);
  EXPECT_EQ(logger_->warnings.size(), 1u);
}

TEST_F(ConfigTest, XdgPathsHonourEnvironment) {
  ::setenv("XDG_DATA_HOME", "/tmp/data", 1);
  EXPECT_EQ(XdgPaths::data_dir().string(), "/tmp/data/bgtasks");
  EXPECT_EQ(XdgPaths::script_dir().string(), "/tmp/data/bgtasks/scripts");
}
