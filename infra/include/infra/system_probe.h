#pragma once

#include "core/resource_monitor.h"

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace bgt::infra {

/// Host probe reading /proc and statvfs. `disk_path` selects the filesystem
/// reported by the disk readings.
std::shared_ptr<core::ISystemProbe>
create_system_probe(const std::string &disk_path = "/");

/// Cumulative jiffies from the aggregate "cpu" line of /proc/stat.
struct CpuTimes {
  std::uint64_t busy = 0;
  std::uint64_t total = 0;
};

/// Parses the first line of /proc/stat. Needs the user, nice, system and idle
/// columns; later columns are optional for older kernels.
std::optional<CpuTimes> parse_cpu_times(std::istream &in);

/// Busy share between two readings, [0, 100]. 0 when no time has elapsed.
double cpu_percent_between(const CpuTimes &previous, const CpuTimes &now);

/// MemTotal and MemAvailable from /proc/meminfo, in bytes.
struct MemInfo {
  std::uint64_t total_bytes = 0;
  std::uint64_t available_bytes = 0;

  /// total - available, 0 when available exceeds total.
  [[nodiscard]] std::uint64_t used_bytes() const;
};

/// Empty when either MemTotal or MemAvailable is missing.
std::optional<MemInfo> parse_meminfo(std::istream &in);

} // namespace bgt::infra
