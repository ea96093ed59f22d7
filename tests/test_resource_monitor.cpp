#include <gtest/gtest.h>

#include "core/resource_monitor.h"
#include "fake_system_probe.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace bgt::core;
using bgt::testing::FakeSystemProbe;

namespace {

constexpr std::uint64_t kMiB = FakeSystemProbe::kMiB;

struct MonitorFixture {
  std::shared_ptr<FakeSystemProbe> probe = std::make_shared<FakeSystemProbe>();
  std::unique_ptr<ResourceMonitor> monitor;

  explicit MonitorFixture(MonitorConfig config = {}) {
    monitor = std::make_unique<ResourceMonitor>(config, probe, nullptr);
  }
};

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

} // namespace

// ============================================================
// Admission
// ============================================================

TEST(ResourceMonitor, AdmitsUnderLimits) {
  MonitorFixture f;
  auto result = f.monitor->start_task("a", "web_scraping");
  ASSERT_TRUE(result.is_ok());

  const auto active = f.monitor->active_tasks();
  ASSERT_EQ(active.size(), 1u);
  EXPECT_EQ(active[0].kind, "web_scraping");
  EXPECT_EQ(active[0].status, MetricStatus::Running);
  EXPECT_EQ(active[0].memory_peak_bytes, 512 * kMiB);
}

TEST(ResourceMonitor, RejectsAtConcurrencyCeiling) {
  MonitorConfig config;
  config.limits.max_concurrent_tasks = 2;
  MonitorFixture f(config);

  ASSERT_TRUE(f.monitor->start_task("a", "export").is_ok());
  ASSERT_TRUE(f.monitor->start_task("b", "export").is_ok());

  auto third = f.monitor->start_task("c", "export");
  ASSERT_TRUE(third.is_err());
  EXPECT_EQ(third.error().category, ErrorCategory::Admission);
  EXPECT_EQ(third.error().code, 2001);
  EXPECT_TRUE(third.error().retryable);
  EXPECT_NE(third.error().message.find("maximum concurrent tasks (2)"),
            std::string::npos);
  EXPECT_EQ(f.monitor->active_tasks().size(), 2u);

  f.monitor->complete_task("a", true);
  EXPECT_TRUE(f.monitor->start_task("c", "export").is_ok());
}

TEST(ResourceMonitor, RejectsWhenMemoryAboveLimit) {
  MonitorFixture f;
  f.probe->memory_used = 3000 * kMiB;

  auto result = f.monitor->start_task("a", "backup");
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().category, ErrorCategory::Admission);
  EXPECT_EQ(result.error().code, 2002);
  EXPECT_EQ(result.error().message, "Cannot start task: memory limit exceeded");

  f.probe->memory_used = 1000 * kMiB;
  EXPECT_TRUE(f.monitor->start_task("a", "backup").is_ok());
}

TEST(ResourceMonitor, NullProbeAdmitsOnConcurrencyOnly) {
  MonitorConfig config;
  config.limits.max_concurrent_tasks = 1;
  ResourceMonitor monitor(config, nullptr, nullptr);

  EXPECT_TRUE(monitor.start_task("a", "export").is_ok());
  EXPECT_TRUE(monitor.start_task("b", "export").is_err());
}

// ============================================================
// Completion and history
// ============================================================

TEST(ResourceMonitor, CompleteMovesToHistory) {
  MonitorFixture f;
  f.monitor->start_task("ok", "export");
  f.monitor->start_task("bad", "export");
  f.monitor->start_task("gone", "export");

  f.monitor->complete_task("ok", true);
  f.monitor->complete_task("bad", false);
  f.monitor->cancel_task("gone");

  EXPECT_TRUE(f.monitor->active_tasks().empty());
  const auto history = f.monitor->completed_history();
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].status, MetricStatus::Completed);
  EXPECT_EQ(history[1].status, MetricStatus::Failed);
  EXPECT_EQ(history[2].status, MetricStatus::Cancelled);
  for (const auto &m : history) {
    EXPECT_TRUE(m.end_time.has_value());
    EXPECT_TRUE(m.duration.has_value());
  }

  const auto snap = f.monitor->snapshot();
  EXPECT_EQ(snap.active_tasks, 0u);
  EXPECT_EQ(snap.completed_tasks, 3u);
}

TEST(ResourceMonitor, UnknownIdsAreIgnored) {
  MonitorFixture f;
  f.monitor->complete_task("missing", true);
  f.monitor->cancel_task("missing");
  EXPECT_TRUE(f.monitor->completed_history().empty());
}

TEST(ResourceMonitor, AverageDurationTracksHistory) {
  MonitorFixture f;
  f.monitor->start_task("a", "export");
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  f.monitor->complete_task("a", true);

  const auto snap = f.monitor->snapshot();
  EXPECT_GE(snap.average_task_duration.count(), 30);
}

TEST(ResourceMonitor, HistoryIsCapped) {
  MonitorConfig config;
  config.history_cap = 3;
  config.limits.max_concurrent_tasks = 10;
  MonitorFixture f(config);

  for (int i = 0; i < 5; ++i) {
    const auto id = "t" + std::to_string(i);
    f.monitor->start_task(id, "export");
    f.monitor->complete_task(id, true);
  }
  const auto history = f.monitor->completed_history();
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history.front().task_id, "t2");
  EXPECT_EQ(history.back().task_id, "t4");
}

TEST(ResourceMonitor, CleanupOldMetrics) {
  MonitorConfig config;
  config.limits.max_concurrent_tasks = 10;
  MonitorFixture f(config);
  for (int i = 0; i < 4; ++i) {
    const auto id = "t" + std::to_string(i);
    f.monitor->start_task(id, "export");
    f.monitor->complete_task(id, true);
  }

  EXPECT_EQ(f.monitor->cleanup_old_metrics(1), 3u);
  EXPECT_EQ(f.monitor->completed_history().size(), 1u);
  EXPECT_EQ(f.monitor->snapshot().completed_tasks, 1u);
  EXPECT_EQ(f.monitor->cleanup_old_metrics(), 0u);
}

// ============================================================
// Sampling
// ============================================================

TEST(ResourceMonitor, SampleNowRefreshesSnapshot) {
  MonitorFixture f;
  f.probe->cpu = 55.0;
  f.probe->memory_used = 4096 * kMiB;
  f.monitor->sample_now();

  const auto snap = f.monitor->snapshot();
  EXPECT_DOUBLE_EQ(snap.cpu_percent, 55.0);
  EXPECT_EQ(snap.memory_used_bytes, 4096 * kMiB);
  EXPECT_EQ(snap.memory_total_bytes, 8192 * kMiB);
  EXPECT_EQ(snap.disk_total_bytes, 100000 * kMiB);
  EXPECT_DOUBLE_EQ(snap.memory_ratio(), 0.5);
}

TEST(ResourceMonitor, SamplerThreadPicksUpChanges) {
  MonitorConfig config;
  config.sample_interval = std::chrono::milliseconds(20);
  MonitorFixture f(config);
  f.monitor->start_monitoring();
  f.monitor->start_monitoring(); // idempotent

  f.probe->cpu = 77.0;
  EXPECT_TRUE(wait_until([&]() { return f.monitor->snapshot().cpu_percent == 77.0; },
                         std::chrono::seconds(2)));
  f.monitor->stop_monitoring();
}

// ============================================================
// Export
// ============================================================

TEST(ResourceMonitor, ExportMetricsSerializesState) {
  MonitorConfig config;
  config.limits.max_concurrent_tasks = 3;
  MonitorFixture f(config);
  f.probe->cpu = 42.5;
  f.monitor->sample_now();
  ASSERT_TRUE(f.monitor->start_task("done", "export").is_ok());
  ASSERT_TRUE(f.monitor->start_task("live", "backup").is_ok());
  f.monitor->complete_task("done", false);

  auto exported = f.monitor->export_metrics();
  ASSERT_TRUE(exported.is_ok());
  const auto doc = nlohmann::json::parse(exported.value());

  EXPECT_TRUE(doc["timestamp"].is_number_integer());
  EXPECT_DOUBLE_EQ(doc["current_metrics"]["cpu_usage"].get<double>(), 42.5);
  EXPECT_EQ(doc["current_metrics"]["memory_total"].get<std::uint64_t>(),
            8192 * kMiB);
  EXPECT_EQ(doc["current_metrics"]["active_tasks"].get<int>(), 1);
  EXPECT_EQ(doc["current_metrics"]["completed_tasks"].get<int>(), 1);

  ASSERT_EQ(doc["active_tasks"].size(), 1u);
  const auto &live = doc["active_tasks"][0];
  EXPECT_EQ(live["task_id"], "live");
  EXPECT_EQ(live["task_type"], "backup");
  EXPECT_EQ(live["status"], "Running");
  EXPECT_TRUE(live["end_time"].is_null());
  EXPECT_TRUE(live["duration_ms"].is_null());
  EXPECT_EQ(live["memory_peak"].get<std::uint64_t>(), 512 * kMiB);

  ASSERT_EQ(doc["completed_tasks"].size(), 1u);
  const auto &done = doc["completed_tasks"][0];
  EXPECT_EQ(done["task_id"], "done");
  EXPECT_EQ(done["status"], "Failed");
  EXPECT_GE(done["end_time"].get<std::int64_t>(),
            done["start_time"].get<std::int64_t>());
  EXPECT_TRUE(done["duration_ms"].is_number_integer());

  EXPECT_EQ(doc["resource_limits"]["max_concurrent_tasks"].get<int>(), 3);
  EXPECT_EQ(doc["resource_limits"]["max_memory_mb"].get<int>(), 2048);
  EXPECT_EQ(doc["resource_limits"]["task_timeout_seconds"].get<int>(), 1800);
}

TEST(ResourceMonitor, ExportMetricsReportsInvalidUtf8) {
  MonitorFixture f;
  ASSERT_TRUE(f.monitor->start_task("bad\xff", "export").is_ok());

  auto exported = f.monitor->export_metrics();
  ASSERT_TRUE(exported.is_err());
  EXPECT_EQ(exported.error().category, ErrorCategory::Internal);
  EXPECT_EQ(exported.error().message.rfind("Failed to export metrics: ", 0), 0u);
}

// ============================================================
// Recommendation
// ============================================================

TEST(ResourceRecommendation, HighCpu) {
  SystemSnapshot snap;
  snap.cpu_percent = 85.0;
  EXPECT_EQ(ResourceMonitor::recommendation_for(snap, ResourceLimits{}),
            "High CPU usage detected. Consider reducing concurrent tasks or "
            "enabling background processing.");
}

TEST(ResourceRecommendation, HighMemory) {
  SystemSnapshot snap;
  snap.cpu_percent = 10.0;
  snap.memory_used_bytes = 90;
  snap.memory_total_bytes = 100;
  EXPECT_EQ(ResourceMonitor::recommendation_for(snap, ResourceLimits{}),
            "High memory usage detected. Consider processing smaller batches "
            "or closing other applications.");
}

TEST(ResourceRecommendation, NearConcurrencyLimit) {
  SystemSnapshot snap;
  snap.active_tasks = 4;
  EXPECT_EQ(ResourceMonitor::recommendation_for(snap, ResourceLimits{}),
            "Near maximum concurrent task limit. New tasks may be queued.");
}

TEST(ResourceRecommendation, Nominal) {
  SystemSnapshot snap;
  snap.active_tasks = 3;
  snap.memory_used_bytes = 10;
  snap.memory_total_bytes = 100;
  EXPECT_EQ(ResourceMonitor::recommendation_for(snap, ResourceLimits{}),
            "System resources are operating within normal limits.");
}

TEST(ResourceRecommendation, ZeroConcurrencyLimitDoesNotWrap) {
  SystemSnapshot snap;
  ResourceLimits limits;
  limits.max_concurrent_tasks = 0;
  EXPECT_EQ(ResourceMonitor::recommendation_for(snap, limits),
            "Near maximum concurrent task limit. New tasks may be queued.");
}

// ============================================================
// Presets
// ============================================================

TEST(ResourcePresets, LowMemoryKeepsOtherFields) {
  MonitorConfig config;
  config.limits.max_cpu_percent = 65.0;
  config.limits.task_timeout_seconds = 60;
  MonitorFixture f(config);

  f.monitor->optimize_for_low_memory();
  const auto limits = f.monitor->limits();
  EXPECT_EQ(limits.max_memory_mb, 1024u);
  EXPECT_EQ(limits.max_concurrent_tasks, 2u);
  EXPECT_DOUBLE_EQ(limits.max_cpu_percent, 65.0);
  EXPECT_EQ(limits.task_timeout_seconds, 60u);
}

TEST(ResourcePresets, PerformanceScalesWithHost) {
  MonitorFixture f;
  f.probe->memory_total = 16384 * kMiB;
  f.probe->cores = 12;

  f.monitor->optimize_for_performance();
  const auto limits = f.monitor->limits();
  EXPECT_EQ(limits.max_memory_mb, 8192u);
  EXPECT_EQ(limits.max_concurrent_tasks, 12u);
}

TEST(ResourcePresets, PerformanceNeverBelowDefault) {
  MonitorFixture f;
  f.probe->memory_total = 2048 * kMiB;

  f.monitor->optimize_for_performance();
  EXPECT_EQ(f.monitor->limits().max_memory_mb, 2048u);
}

TEST(ResourcePresets, BalancedRestoresDefaults) {
  MonitorFixture f;
  f.monitor->optimize_for_low_memory();
  f.monitor->optimize_balanced();

  const auto limits = f.monitor->limits();
  const ResourceLimits defaults;
  EXPECT_EQ(limits.max_memory_mb, defaults.max_memory_mb);
  EXPECT_EQ(limits.max_concurrent_tasks, defaults.max_concurrent_tasks);
  EXPECT_DOUBLE_EQ(limits.max_cpu_percent, defaults.max_cpu_percent);
  EXPECT_EQ(limits.task_timeout_seconds, defaults.task_timeout_seconds);
}

TEST(ResourcePresets, SetLimitsReplacesWholesale) {
  MonitorFixture f;
  ResourceLimits custom;
  custom.max_memory_mb = 100;
  custom.max_concurrent_tasks = 1;
  custom.task_timeout_seconds = 0;
  f.monitor->set_limits(custom);

  const auto limits = f.monitor->limits();
  EXPECT_EQ(limits.max_memory_mb, 100u);
  EXPECT_EQ(limits.max_concurrent_tasks, 1u);
  EXPECT_EQ(limits.task_timeout_seconds, 0u);
}
