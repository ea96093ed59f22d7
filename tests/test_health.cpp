#include <gtest/gtest.h>

#include "core/health.h"
#include "fake_system_probe.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace bgt::core;
using bgt::testing::FakeSystemProbe;
using namespace std::chrono_literals;

namespace {

class TokenWaitExecutor : public ITaskExecutor {
public:
  std::string name() const override { return "TokenWaitExecutor"; }

  Result<void, TaskError> execute(ExecutionContext &ctx) override {
    if (ctx.cancel_token->wait_for(10s)) {
      return Result<void, TaskError>::Err(TaskError::Canceled());
    }
    return Result<void, TaskError>::Ok();
  }
};

SystemSnapshot snapshot_with(double cpu, double memory_ratio) {
  SystemSnapshot s;
  s.cpu_percent = cpu;
  s.memory_total_bytes = 1000;
  s.memory_used_bytes = static_cast<std::uint64_t>(memory_ratio * 1000.0);
  return s;
}

template <typename Pred> bool wait_until(Pred pred) {
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

std::unique_ptr<ITaskEngine> idle_engine() {
  EngineConfig config;
  config.max_workers = 1;
  config.tick_interval = std::chrono::hours(1);
  ExecutorTable table;
  table.bind_all(std::make_shared<TokenWaitExecutor>());
  return create_task_engine(config, table, nullptr, nullptr);
}

} // namespace

TEST(Health, ClassifyThresholds) {
  EXPECT_EQ(classify_health(snapshot_with(10.0, 0.10)), "healthy");
  EXPECT_EQ(classify_health(snapshot_with(70.0, 0.75)), "healthy");
  EXPECT_EQ(classify_health(snapshot_with(70.5, 0.10)), "warning");
  EXPECT_EQ(classify_health(snapshot_with(10.0, 0.80)), "warning");
  EXPECT_EQ(classify_health(snapshot_with(90.0, 0.90)), "warning");
  EXPECT_EQ(classify_health(snapshot_with(95.0, 0.10)), "critical");
  EXPECT_EQ(classify_health(snapshot_with(10.0, 0.95)), "critical");
}

TEST(Health, UnknownMemoryTotalIsNotCritical) {
  SystemSnapshot s;
  s.memory_used_bytes = 5000;
  s.memory_total_bytes = 0;
  EXPECT_EQ(classify_health(s), "healthy");
}

TEST(Health, SummaryCombinesEngineAndMonitor) {
  auto probe = std::make_shared<FakeSystemProbe>();
  probe->cpu = 75.0;
  ResourceMonitor monitor(MonitorConfig{}, probe, nullptr);
  monitor.sample_now();

  auto engine = idle_engine();
  ASSERT_TRUE(engine->submit(TaskKind::Export, TaskPriority::Normal, {}).is_ok());
  ASSERT_TRUE(engine->submit(TaskKind::Backup, TaskPriority::Normal, {}).is_ok());

  const auto summary = health_summary(*engine, monitor);
  EXPECT_EQ(summary.status, "warning");
  EXPECT_DOUBLE_EQ(summary.snapshot.cpu_percent, 75.0);
  EXPECT_EQ(summary.queue_length, 2u);
  EXPECT_EQ(summary.active_workers, 0);
  EXPECT_EQ(summary.max_workers, 1);
  EXPECT_EQ(summary.stats.total, 2u);
  EXPECT_EQ(summary.recommendation,
            "System resources are operating within normal limits.");
}

TEST(Health, BaseMinutesPerKind) {
  EXPECT_DOUBLE_EQ(base_minutes(TaskKind::Export), 1.0);
  EXPECT_DOUBLE_EQ(base_minutes(TaskKind::ChunkGeneration), 1.5);
  EXPECT_DOUBLE_EQ(base_minutes(TaskKind::BatchProcessing), 8.0);
  EXPECT_DOUBLE_EQ(base_minutes(TaskKind::Backup), 5.0);
  // Kinds without a dedicated baseline share the default.
  EXPECT_DOUBLE_EQ(base_minutes(TaskKind::RelationshipExtraction), 3.0);
  EXPECT_DOUBLE_EQ(base_minutes(TaskKind::PythonPackageInstall), 3.0);
}

TEST(Health, EstimateOnIdleEngine) {
  auto engine = idle_engine();
  const auto estimate = estimate_completion(*engine, TaskKind::MetadataEnrichment);
  EXPECT_EQ(estimate.kind, TaskKind::MetadataEnrichment);
  EXPECT_DOUBLE_EQ(estimate.load_multiplier, 1.0);
  EXPECT_DOUBLE_EQ(estimate.estimated_minutes, 4.0);
  EXPECT_EQ(estimate.queue_position, 1u);
}

TEST(Health, EstimateScalesWithQueue) {
  auto engine = idle_engine();
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(engine->submit(TaskKind::Export, TaskPriority::Normal, {}).is_ok());
  }
  const auto estimate = estimate_completion(*engine, TaskKind::Backup);
  EXPECT_NEAR(estimate.load_multiplier, 1.3, 1e-9);
  EXPECT_NEAR(estimate.estimated_minutes, 6.5, 1e-9);
  EXPECT_EQ(estimate.queue_position, 4u);
}

TEST(Health, ApplyOptimizationPresets) {
  auto probe = std::make_shared<FakeSystemProbe>();
  ResourceMonitor monitor(MonitorConfig{}, probe, nullptr);

  ASSERT_TRUE(apply_optimization(monitor, "low_memory").is_ok());
  EXPECT_EQ(monitor.limits().max_memory_mb, 1024u);
  EXPECT_EQ(monitor.limits().max_concurrent_tasks, 2u);

  ASSERT_TRUE(apply_optimization(monitor, "balanced").is_ok());
  EXPECT_EQ(monitor.limits().max_memory_mb, 2048u);
  EXPECT_EQ(monitor.limits().max_concurrent_tasks, 4u);

  ASSERT_TRUE(apply_optimization(monitor, "performance").is_ok());
  EXPECT_EQ(monitor.limits().max_concurrent_tasks, 8u);
}

TEST(Health, ApplyOptimizationRejectsUnknownMode) {
  ResourceMonitor monitor(MonitorConfig{}, std::make_shared<FakeSystemProbe>(),
                          nullptr);
  const auto before = monitor.limits();

  auto result = apply_optimization(monitor, "turbo");
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().category, ErrorCategory::Submission);
  EXPECT_EQ(result.error().message, "Unknown optimization mode: turbo");
  EXPECT_EQ(monitor.limits().max_memory_mb, before.max_memory_mb);
  EXPECT_EQ(monitor.limits().max_concurrent_tasks, before.max_concurrent_tasks);
}

TEST(Health, EmergencyCleanupSparesCriticalTasks) {
  auto monitor = std::make_shared<ResourceMonitor>(
      MonitorConfig{}, std::make_shared<FakeSystemProbe>(), nullptr);
  EngineConfig config;
  config.max_workers = 3;
  config.tick_interval = 10ms;
  ExecutorTable table;
  table.bind_all(std::make_shared<TokenWaitExecutor>());
  auto engine = create_task_engine(config, table, monitor, nullptr);

  const auto critical =
      engine->submit(TaskKind::Backup, TaskPriority::Critical, {}).value();
  const auto normal =
      engine->submit(TaskKind::Export, TaskPriority::Normal, {}).value();
  const auto low = engine->submit(TaskKind::Export, TaskPriority::Low, {}).value();
  ASSERT_TRUE(wait_until([&]() { return engine->get_active().size() == 3; }));

  EXPECT_EQ(emergency_cleanup(*engine, *monitor), 2u);

  auto status_of = [&](const std::string &id) { return engine->get_status(id)->status; };
  ASSERT_TRUE(wait_until([&]() {
    return status_of(normal) == TaskStatus::Cancelled &&
           status_of(low) == TaskStatus::Cancelled;
  }));
  EXPECT_EQ(status_of(critical), TaskStatus::Running);
  EXPECT_EQ(monitor->limits().max_memory_mb, 1024u);
  EXPECT_EQ(monitor->limits().max_concurrent_tasks, 2u);
}
