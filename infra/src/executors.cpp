#include "infra/executors.h"

#include "core/task_error.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cctype>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>
#include <utility>

extern char **environ;

namespace bgt::infra {

namespace {

using core::ErrorCategory;
using core::Result;
using core::TaskError;
using core::TaskKind;

/// Owns one file descriptor.
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_(other.release()) {}
  UniqueFd &operator=(UniqueFd &&other) noexcept {
    if (this != &other) {
      reset();
      fd_ = other.release();
    }
    return *this;
  }

  [[nodiscard]] int get() const { return fd_; }

  int release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void reset() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
};

bool make_pipe(UniqueFd &read_end, UniqueFd &write_end) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return false;
  }
  read_end = UniqueFd(fds[0]);
  write_end = UniqueFd(fds[1]);
  return true;
}

/// Splits a byte stream into '\n'-terminated lines.
class LineBuffer {
public:
  template <typename Fn> void feed(const char *data, std::size_t size, Fn &&on_line) {
    buffer_.append(data, size);
    std::size_t pos = 0;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
      std::string line = buffer_.substr(0, pos);
      buffer_.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      on_line(line);
    }
  }

  template <typename Fn> void flush(Fn &&on_line) {
    if (!buffer_.empty()) {
      on_line(buffer_);
      buffer_.clear();
    }
  }

private:
  std::string buffer_;
};

std::vector<char *> to_argv(std::vector<std::string> &items) {
  std::vector<char *> out;
  out.reserve(items.size() + 1);
  for (auto &item : items) {
    out.push_back(item.data());
  }
  out.push_back(nullptr);
  return out;
}

std::string describe_status(int status) {
  if (WIFEXITED(status)) {
    return "exit status " + std::to_string(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return "killed by signal " + std::to_string(WTERMSIG(status));
  }
  return "unknown status";
}

constexpr std::chrono::milliseconds kExitPollInterval{20};

Result<void, TaskError> canceled() {
  return Result<void, TaskError>::Err(
      TaskError::Canceled("Cancelled during execution"));
}

} // namespace

// ========== Simulated steps ==========

const std::vector<SimulatedStep> &simulated_steps(TaskKind kind) {
  static const std::vector<SimulatedStep> web_scraping{
      {10.0f, "Connecting to source"},
      {25.0f, "Downloading content"},
      {50.0f, "Parsing HTML structure"},
      {75.0f, "Extracting text content"},
      {100.0f, "Scraping completed"}};
  static const std::vector<SimulatedStep> text_processing{
      {15.0f, "Analyzing text structure"},
      {35.0f, "Cleaning text content"},
      {60.0f, "Normalizing formatting"},
      {85.0f, "Validating quality"},
      {100.0f, "Text processing completed"}};
  static const std::vector<SimulatedStep> chunk_generation{
      {20.0f, "Analyzing content boundaries"},
      {40.0f, "Applying chunking strategy"},
      {70.0f, "Generating chunks"},
      {90.0f, "Validating chunk quality"},
      {100.0f, "Chunking completed"}};
  static const std::vector<SimulatedStep> export_steps{
      {25.0f, "Preparing export data"},
      {50.0f, "Formatting output"},
      {75.0f, "Writing files"},
      {100.0f, "Export completed"}};
  static const std::vector<SimulatedStep> metadata_enrichment{
      {20.0f, "Querying external APIs"},
      {45.0f, "Processing metadata"},
      {70.0f, "Enriching book information"},
      {90.0f, "Validating enrichments"},
      {100.0f, "Metadata enrichment completed"}};
  static const std::vector<SimulatedStep> visual_asset_download{
      {30.0f, "Downloading cover images"},
      {60.0f, "Processing images"},
      {85.0f, "Caching assets"},
      {100.0f, "Visual assets ready"}};
  static const std::vector<SimulatedStep> cloud_sync{
      {25.0f, "Connecting to cloud storage"},
      {50.0f, "Uploading changes"},
      {75.0f, "Syncing metadata"},
      {100.0f, "Sync completed"}};
  static const std::vector<SimulatedStep> backup{
      {20.0f, "Preparing backup"},
      {40.0f, "Compressing data"},
      {70.0f, "Creating archive"},
      {90.0f, "Verifying backup"},
      {100.0f, "Backup completed"}};
  static const std::vector<SimulatedStep> quality_analysis{
      {30.0f, "Analyzing content quality"},
      {60.0f, "Checking completeness"},
      {85.0f, "Generating quality report"},
      {100.0f, "Quality analysis completed"}};
  static const std::vector<SimulatedStep> batch_processing{
      {10.0f, "Initializing batch"},
      {25.0f, "Processing items 1-10"},
      {45.0f, "Processing items 11-20"},
      {65.0f, "Processing items 21-30"},
      {85.0f, "Finalizing batch"},
      {100.0f, "Batch processing completed"}};
  static const std::vector<SimulatedStep> advanced_chunking{
      {15.0f, "Initializing advanced chunking"},
      {30.0f, "Analyzing text structure"},
      {50.0f, "Applying chunking strategies"},
      {75.0f, "Optimizing chunk boundaries"},
      {90.0f, "Validating chunks"},
      {100.0f, "Advanced chunking completed"}};
  static const std::vector<SimulatedStep> quality_assessment{
      {20.0f, "Loading ML models"},
      {40.0f, "Analyzing text quality"},
      {60.0f, "Computing readability scores"},
      {80.0f, "Assessing coherence"},
      {95.0f, "Generating quality report"},
      {100.0f, "Quality assessment completed"}};
  static const std::vector<SimulatedStep> relationship_extraction{
      {10.0f, "Initializing relationship extraction"},
      {25.0f, "Computing semantic embeddings"},
      {45.0f, "Analyzing chunk similarities"},
      {65.0f, "Extracting relationships"},
      {85.0f, "Building relationship graph"},
      {100.0f, "Relationship extraction completed"}};
  static const std::vector<SimulatedStep> python_package_install{
      {10.0f, "Checking Python environment"},
      {25.0f, "Downloading packages"},
      {50.0f, "Installing dependencies"},
      {75.0f, "Compiling native extensions"},
      {90.0f, "Verifying installation"},
      {100.0f, "Package installation completed"}};

  switch (kind) {
  case TaskKind::WebScraping:
    return web_scraping;
  case TaskKind::TextProcessing:
    return text_processing;
  case TaskKind::ChunkGeneration:
    return chunk_generation;
  case TaskKind::Export:
    return export_steps;
  case TaskKind::MetadataEnrichment:
    return metadata_enrichment;
  case TaskKind::VisualAssetDownload:
    return visual_asset_download;
  case TaskKind::CloudSync:
    return cloud_sync;
  case TaskKind::Backup:
    return backup;
  case TaskKind::QualityAnalysis:
    return quality_analysis;
  case TaskKind::BatchProcessing:
    return batch_processing;
  case TaskKind::AdvancedChunking:
    return advanced_chunking;
  case TaskKind::QualityAssessment:
    return quality_assessment;
  case TaskKind::RelationshipExtraction:
    return relationship_extraction;
  case TaskKind::PythonPackageInstall:
    return python_package_install;
  }
  return text_processing;
}

std::chrono::milliseconds default_step_delay(TaskKind kind) {
  switch (kind) {
  case TaskKind::WebScraping:
  case TaskKind::Backup:
    return std::chrono::milliseconds(500);
  case TaskKind::TextProcessing:
  case TaskKind::VisualAssetDownload:
    return std::chrono::milliseconds(400);
  case TaskKind::ChunkGeneration:
    return std::chrono::milliseconds(300);
  case TaskKind::Export:
    return std::chrono::milliseconds(250);
  case TaskKind::MetadataEnrichment:
  case TaskKind::AdvancedChunking:
    return std::chrono::milliseconds(600);
  case TaskKind::CloudSync:
  case TaskKind::QualityAssessment:
    return std::chrono::milliseconds(800);
  case TaskKind::QualityAnalysis:
    return std::chrono::milliseconds(350);
  case TaskKind::BatchProcessing:
  case TaskKind::RelationshipExtraction:
    return std::chrono::milliseconds(700);
  case TaskKind::PythonPackageInstall:
    return std::chrono::milliseconds(1200);
  }
  return std::chrono::milliseconds(500);
}

// ========== SimulatedExecutor ==========

SimulatedExecutor::SimulatedExecutor(
    std::optional<std::chrono::milliseconds> step_delay)
    : step_delay_(step_delay) {}

Result<void, TaskError> SimulatedExecutor::execute(core::ExecutionContext &ctx) {
  const auto delay = step_delay_.value_or(default_step_delay(ctx.kind));

  for (const auto &step : simulated_steps(ctx.kind)) {
    if (ctx.is_canceled()) {
      return canceled();
    }
    ctx.emit(step.progress, step.message);

    if (delay.count() <= 0) {
      continue;
    }
    if (ctx.cancel_token) {
      if (ctx.cancel_token->wait_for(delay)) {
        return canceled();
      }
    } else {
      std::this_thread::sleep_for(delay);
    }
  }
  return Result<void, TaskError>::Ok();
}

// ========== ProcessExecutor ==========

ProcessExecutor::ProcessExecutor(ProcessOptions options,
                                 std::shared_ptr<core::ILogger> logger)
    : options_(std::move(options)), logger_(std::move(logger)) {}

std::string ProcessExecutor::script_path(TaskKind kind) const {
  return (std::filesystem::path(options_.script_dir) /
          (std::string(core::to_string(kind)) + options_.script_extension))
      .string();
}

std::string ProcessExecutor::env_name(const std::string &metadata_key) {
  std::string name = "BGT_META_";
  name.reserve(name.size() + metadata_key.size());
  for (const unsigned char c : metadata_key) {
    name.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_');
  }
  return name;
}

bool ProcessExecutor::parse_progress_line(const std::string &line,
                                          float &progress,
                                          std::string &message) {
  static const std::string kTag = "PROGRESS ";
  if (line.compare(0, kTag.size(), kTag) != 0) {
    return false;
  }

  std::istringstream iss(line.substr(kTag.size()));
  float value = 0.0f;
  if (!(iss >> value)) {
    return false;
  }
  std::string rest;
  std::getline(iss, rest);
  const auto first = rest.find_first_not_of(' ');
  message = first == std::string::npos ? std::string() : rest.substr(first);
  progress = value;
  return true;
}

Result<void, TaskError> ProcessExecutor::execute(core::ExecutionContext &ctx) {
  const std::string script = script_path(ctx.kind);
  std::error_code ec;
  if (!std::filesystem::exists(script, ec)) {
    return Result<void, TaskError>::Err(
        TaskError(ErrorCategory::Execution, 3002, false,
                  "Executor script not found", "missing script " + script,
                  {{"script", script}}));
  }

  // argv and envp are built before fork(); the child only calls
  // async-signal-safe functions.
  std::vector<std::string> args{options_.interpreter, script};
  std::vector<std::string> env;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string item(*entry);
    if (item.rfind("BGT_META_", 0) == 0 || item.rfind("BGT_TASK_", 0) == 0) {
      continue;
    }
    env.push_back(item);
  }
  env.push_back("BGT_TASK_ID=" + ctx.task_id);
  env.push_back(std::string("BGT_TASK_KIND=") + core::to_string(ctx.kind));
  for (const auto &[key, value] : ctx.metadata) {
    env.push_back(env_name(key) + "=" + value);
  }
  auto argv = to_argv(args);
  auto envp = to_argv(env);

  UniqueFd out_read, out_write, err_read, err_write;
  if (!make_pipe(out_read, out_write) || !make_pipe(err_read, err_write)) {
    return Result<void, TaskError>::Err(TaskError::Execution(
        std::string("Failed to create pipes: ") + std::strerror(errno)));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    return Result<void, TaskError>::Err(TaskError::Execution(
        std::string("Failed to spawn executor: ") + std::strerror(errno)));
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
    }
    ::dup2(out_write.get(), STDOUT_FILENO);
    ::dup2(err_write.get(), STDERR_FILENO);
    ::execvpe(argv[0], argv.data(), envp.data());
    static const char kExecFailed[] = "failed to exec interpreter\n";
    [[maybe_unused]] const auto written =
        ::write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  out_write.reset();
  err_write.reset();

  LineBuffer out_lines;
  LineBuffer err_lines;
  std::string last_error;

  auto on_stdout = [&](const std::string &line) {
    float progress = 0.0f;
    std::string message;
    if (parse_progress_line(line, progress, message)) {
      ctx.emit(progress, message);
    } else if (logger_) {
      logger_->debug(ctx.task_id, "process_executor", "stdout", line);
    }
  };
  auto on_stderr = [&](const std::string &line) {
    if (line.find_first_not_of(" \t") != std::string::npos) {
      last_error = line;
    }
    if (logger_) {
      logger_->debug(ctx.task_id, "process_executor", "stderr", line);
    }
  };

  bool terminated = false;
  bool killed = false;
  std::chrono::steady_clock::time_point terminate_sent;

  // SIGTERM once the token fires, SIGKILL after the grace period. Applied
  // both while the pipes are open and while waiting for the exit status, so
  // a child that closes its output cannot outlive a cancel.
  auto enforce_cancel = [&]() {
    if (!terminated && ctx.is_canceled()) {
      ::kill(-pid, SIGTERM);
      terminated = true;
      terminate_sent = std::chrono::steady_clock::now();
      if (logger_) {
        logger_->info(ctx.task_id, "process_executor", "terminate",
                      "SIGTERM sent to pid " + std::to_string(pid));
      }
    } else if (terminated && !killed &&
               std::chrono::steady_clock::now() - terminate_sent >=
                   options_.kill_grace) {
      ::kill(-pid, SIGKILL);
      killed = true;
    }
  };

  pollfd fds[2] = {{out_read.get(), POLLIN, 0}, {err_read.get(), POLLIN, 0}};
  int open_streams = 2;
  char buffer[4096];

  while (open_streams > 0) {
    enforce_cancel();

    const int rc = ::poll(fds, 2, 100);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::kill(-pid, SIGKILL);
      killed = true;
      break;
    }

    for (auto &fd : fds) {
      if (fd.fd < 0 || (fd.revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      const ssize_t n = ::read(fd.fd, buffer, sizeof(buffer));
      if (n > 0) {
        if (fd.fd == out_read.get()) {
          out_lines.feed(buffer, static_cast<std::size_t>(n), on_stdout);
        } else {
          err_lines.feed(buffer, static_cast<std::size_t>(n), on_stderr);
        }
      } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        fd.fd = -1;
        --open_streams;
      }
    }
  }
  out_lines.flush(on_stdout);
  err_lines.flush(on_stderr);

  int status = 0;
  while (true) {
    const pid_t done = ::waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      break;
    }
    if (done < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Result<void, TaskError>::Err(TaskError::Internal(
          std::string("waitpid failed: ") + std::strerror(errno)));
    }
    enforce_cancel();
    std::this_thread::sleep_for(kExitPollInterval);
  }

  if (terminated || ctx.is_canceled()) {
    return canceled();
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    return Result<void, TaskError>::Ok();
  }

  const std::string detail = describe_status(status);
  const std::string message =
      last_error.empty() ? std::string(core::to_string(ctx.kind)) + " failed (" +
                               detail + ")"
                         : last_error;
  return Result<void, TaskError>::Err(
      TaskError(ErrorCategory::Execution, 3001, false, message,
                script + ": " + detail, {{"script", script}, {"status", detail}}));
}

} // namespace bgt::infra
