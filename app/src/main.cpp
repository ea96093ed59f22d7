#include "core/health.h"
#include "core/logger.h"
#include "core/resource_monitor.h"
#include "core/task.h"
#include "core/task_engine.h"
#include "infra/config.h"
#include "infra/executor_factory.h"
#include "infra/logger.h"
#include "infra/system_probe.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using bgt::core::ILogger;
using bgt::core::TaskKind;
using bgt::core::TaskPriority;

std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted.store(true); }

void print_usage() {
  std::cout
      << "Usage: bgtasks <command> [args]\n"
         "\n"
         "Commands:\n"
         "  run <kind>[:priority]... [--meta key=value]... [--optimize mode]\n"
         "      Submit tasks and wait until every one is terminal.\n"
         "  health        Print a health summary of this host.\n"
         "  metrics       Print the resource monitor state as JSON.\n"
         "  estimate <kind>\n"
         "                Print the completion estimate for a new task.\n"
         "  kinds         List task kinds.\n"
         "\n"
         "Environment: BGT_MAX_WORKERS, BGT_TICK_MS, BGT_SAMPLE_MS,\n"
         "  BGT_HISTORY_CAP, BGT_MAX_MEMORY_MB, BGT_MAX_CPU_PERCENT,\n"
         "  BGT_MAX_CONCURRENT, BGT_TASK_TIMEOUT_S, BGT_EXECUTOR,\n"
         "  BGT_INTERPRETER, BGT_SCRIPT_DIR, BGT_STEP_MS, BGT_LOG_LEVEL\n";
}

std::string megabytes(std::uint64_t bytes) {
  return std::to_string(bytes / (1024ULL * 1024ULL)) + " MB";
}

void print_health(const bgt::core::HealthSummary &h) {
  std::cout << std::fixed << std::setprecision(1)
            << "status:          " << h.status << "\n"
            << "cpu:             " << h.snapshot.cpu_percent << "%\n"
            << "memory:          " << megabytes(h.snapshot.memory_used_bytes)
            << " / " << megabytes(h.snapshot.memory_total_bytes) << "\n"
            << "disk:            " << megabytes(h.snapshot.disk_used_bytes) << " / "
            << megabytes(h.snapshot.disk_total_bytes) << "\n"
            << "queue:           " << h.queue_length << "\n"
            << "workers:         " << h.active_workers << " / " << h.max_workers
            << "\n"
            << "tasks:           " << h.stats.total << " total, "
            << h.stats.completed << " completed, " << h.stats.failed
            << " failed, " << h.stats.cancelled << " cancelled\n"
            << "success rate:    " << h.stats.success_rate << "%\n"
            << "recommendation:  " << h.recommendation << "\n";
}

void print_task(const bgt::core::Task &task) {
  std::cout << std::left << std::setw(38) << task.id << std::setw(24)
            << bgt::core::to_string(task.kind) << std::setw(11)
            << bgt::core::to_string(task.status) << std::right << std::fixed
            << std::setprecision(0) << std::setw(4) << task.progress << "%  "
            << task.message;
  if (task.error) {
    std::cout << " (" << task.error->message << ")";
  }
  std::cout << "\n";
}

struct RunRequest {
  TaskKind kind;
  TaskPriority priority;
};

bool parse_run_args(const std::vector<std::string> &args,
                    std::vector<RunRequest> &requests,
                    bgt::core::Metadata &metadata, std::string &optimize) {
  for (std::size_t i = 1; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--meta" && i + 1 < args.size()) {
      const std::string &pair = args[++i];
      const auto eq = pair.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << "Invalid --meta value: " << pair << "\n";
        return false;
      }
      metadata[pair.substr(0, eq)] = pair.substr(eq + 1);
      continue;
    }
    if (arg == "--optimize" && i + 1 < args.size()) {
      optimize = args[++i];
      continue;
    }

    const auto colon = arg.find(':');
    const auto kind = bgt::core::parse_task_kind(arg.substr(0, colon));
    if (!kind) {
      std::cerr << "Unknown task kind: " << arg.substr(0, colon) << "\n";
      return false;
    }
    auto priority = TaskPriority::Normal;
    if (colon != std::string::npos) {
      const auto parsed = bgt::core::parse_task_priority(arg.substr(colon + 1));
      if (!parsed) {
        std::cerr << "Unknown priority: " << arg.substr(colon + 1) << "\n";
        return false;
      }
      priority = *parsed;
    }
    requests.push_back({*kind, priority});
  }
  return !requests.empty();
}

bool all_terminal(const std::vector<bgt::core::Task> &tasks) {
  for (const auto &task : tasks) {
    if (!task.is_terminal()) {
      return false;
    }
  }
  return true;
}

int run_tasks(bgt::core::ITaskEngine &engine, bgt::core::ResourceMonitor &monitor,
              const std::vector<std::string> &args,
              const std::shared_ptr<ILogger> &logger) {
  std::vector<RunRequest> requests;
  bgt::core::Metadata metadata;
  std::string optimize;
  if (!parse_run_args(args, requests, metadata, optimize)) {
    print_usage();
    return 2;
  }

  if (!optimize.empty()) {
    auto applied = bgt::core::apply_optimization(monitor, optimize);
    if (applied.is_err()) {
      std::cerr << applied.error().message << "\n";
      return 2;
    }
  }

  for (const auto &request : requests) {
    auto submitted = engine.submit(request.kind, request.priority, metadata);
    if (submitted.is_err()) {
      std::cerr << "Submit failed: " << submitted.error().message << "\n";
      return 1;
    }
  }

  bool interrupted = false;
  while (!all_terminal(engine.get_all())) {
    if (g_interrupted.load() && !interrupted) {
      interrupted = true;
      logger->warn("app", "app", "interrupted", "Cancelling outstanding tasks");
      for (const auto &task : engine.get_all()) {
        if (!task.is_terminal()) {
          auto cancelled = engine.cancel(task.id);
          if (cancelled.is_err()) {
            logger->warn(task.id, "app", "cancel_failed",
                         cancelled.error().message);
          }
        }
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  for (const auto &task : engine.get_all()) {
    print_task(task);
  }
  const auto stats = engine.system_stats();
  std::cout << std::fixed << std::setprecision(1) << "\n"
            << stats.completed << "/" << stats.total << " completed, "
            << stats.failed << " failed, " << stats.cancelled
            << " cancelled (success rate " << stats.success_rate << "%)\n";
  return stats.failed == 0 && stats.cancelled == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty() || args[0] == "help" || args[0] == "--help") {
    print_usage();
    return args.empty() ? 2 : 0;
  }
  const std::string &command = args[0];

  if (command == "kinds") {
    for (std::size_t i = 0; i < bgt::core::kTaskKindCount; ++i) {
      const auto kind = static_cast<TaskKind>(i);
      std::cout << std::left << std::setw(26) << bgt::core::to_string(kind)
                << "~" << bgt::core::base_minutes(kind) << " min\n";
    }
    return 0;
  }

  std::shared_ptr<ILogger> logger = bgt::infra::create_console_logger();
  const auto config = bgt::infra::AppConfig::from_environment(logger);

  bgt::infra::ExecutorFactory factory(config.executor, logger);
  auto table = factory.build_table();
  if (table.is_err()) {
    logger->error("startup", "app", "executor_config", table.error().message);
    return 1;
  }

  auto monitor = std::make_shared<bgt::core::ResourceMonitor>(
      config.monitor, bgt::infra::create_system_probe(), logger);
  monitor->sample_now();
  monitor->start_monitoring();

  auto engine = bgt::core::create_task_engine(config.engine,
                                              std::move(table).value(),
                                              monitor, logger);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  int rc = 0;
  if (command == "health") {
    print_health(bgt::core::health_summary(*engine, *monitor));
  } else if (command == "metrics") {
    auto exported = monitor->export_metrics();
    if (exported.is_err()) {
      logger->error("app", "app", "metrics_export", exported.error().message);
      rc = 1;
    } else {
      std::cout << exported.value() << "\n";
    }
  } else if (command == "estimate") {
    const auto kind =
        args.size() > 1 ? bgt::core::parse_task_kind(args[1]) : std::nullopt;
    if (!kind) {
      print_usage();
      rc = 2;
    } else {
      const auto estimate = bgt::core::estimate_completion(*engine, *kind);
      std::cout << std::fixed << std::setprecision(1)
                << bgt::core::to_string(estimate.kind) << ": ~"
                << estimate.estimated_minutes << " min (queue position "
                << estimate.queue_position << ", load x"
                << estimate.load_multiplier << ")\n";
    }
  } else if (command == "run") {
    rc = run_tasks(*engine, *monitor, args, logger);
  } else {
    print_usage();
    rc = 2;
  }

  engine->shutdown();
  engine.reset();
  monitor->stop_monitoring();
  return rc;
}
