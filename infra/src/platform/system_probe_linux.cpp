#include "infra/system_probe.h"

#include <sys/statvfs.h>

#include <cstdint>
#include <fstream>
#include <istream>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

namespace bgt::infra {

std::optional<CpuTimes> parse_cpu_times(std::istream &in) {
  std::string line;
  if (!std::getline(in, line)) {
    return std::nullopt;
  }
  std::istringstream iss(line);
  std::string label;
  iss >> label;
  if (label != "cpu") {
    return std::nullopt;
  }

  // user nice system idle iowait irq softirq steal
  std::uint64_t fields[8] = {};
  int parsed = 0;
  while (parsed < 8 && iss >> fields[parsed]) {
    ++parsed;
  }
  if (parsed < 4) {
    return std::nullopt;
  }

  CpuTimes out;
  for (int i = 0; i < parsed; ++i) {
    out.total += fields[i];
  }
  const std::uint64_t idle_total = fields[3] + fields[4];
  out.busy = out.total - idle_total;
  return out;
}

double cpu_percent_between(const CpuTimes &previous, const CpuTimes &now) {
  if (now.total <= previous.total || now.busy < previous.busy) {
    return 0.0;
  }
  const auto busy = static_cast<double>(now.busy - previous.busy);
  const auto total = static_cast<double>(now.total - previous.total);
  const double percent = busy / total * 100.0;
  return percent > 100.0 ? 100.0 : percent;
}

std::uint64_t MemInfo::used_bytes() const {
  return available_bytes > total_bytes ? 0 : total_bytes - available_bytes;
}

std::optional<MemInfo> parse_meminfo(std::istream &in) {
  MemInfo info;
  bool have_total = false;
  bool have_available = false;
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream iss(line);
    std::string key;
    std::uint64_t value_kb = 0;
    if (!(iss >> key >> value_kb)) {
      continue;
    }
    if (key == "MemTotal:") {
      info.total_bytes = value_kb * 1024;
      have_total = true;
    } else if (key == "MemAvailable:") {
      info.available_bytes = value_kb * 1024;
      have_available = true;
    }
  }
  if (!have_total || !have_available) {
    return std::nullopt;
  }
  return info;
}

namespace {

std::optional<CpuTimes> read_cpu_times() {
  std::ifstream stat_file("/proc/stat");
  return parse_cpu_times(stat_file);
}

std::optional<MemInfo> read_meminfo() {
  std::ifstream mem_file("/proc/meminfo");
  return parse_meminfo(mem_file);
}

class LinuxSystemProbe final : public core::ISystemProbe {
public:
  explicit LinuxSystemProbe(std::string disk_path)
      : disk_path_(std::move(disk_path)), previous_(read_cpu_times()) {}

  double cpu_percent() override {
    const auto now = read_cpu_times();
    if (!now) {
      return 0.0;
    }
    const double percent = previous_ ? cpu_percent_between(*previous_, *now) : 0.0;
    previous_ = now;
    return percent;
  }

  std::uint64_t memory_used_bytes() override {
    const auto info = read_meminfo();
    return info ? info->used_bytes() : 0;
  }

  std::uint64_t memory_total_bytes() override {
    const auto info = read_meminfo();
    return info ? info->total_bytes : 0;
  }

  std::uint64_t disk_used_bytes() override {
    struct statvfs fs {};
    if (statvfs(disk_path_.c_str(), &fs) != 0) {
      return 0;
    }
    const std::uint64_t total = static_cast<std::uint64_t>(fs.f_blocks) * fs.f_frsize;
    const std::uint64_t free = static_cast<std::uint64_t>(fs.f_bfree) * fs.f_frsize;
    return total - free;
  }

  std::uint64_t disk_total_bytes() override {
    struct statvfs fs {};
    if (statvfs(disk_path_.c_str(), &fs) != 0) {
      return 0;
    }
    return static_cast<std::uint64_t>(fs.f_blocks) * fs.f_frsize;
  }

  unsigned cpu_count() override { return std::thread::hardware_concurrency(); }

private:
  std::string disk_path_;
  std::optional<CpuTimes> previous_;
};

} // namespace

std::shared_ptr<core::ISystemProbe> create_system_probe(const std::string &disk_path) {
  return std::make_shared<LinuxSystemProbe>(disk_path);
}

} // namespace bgt::infra
