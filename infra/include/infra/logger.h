#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace bgt::infra {

/// spdlog-backed console logger.
/// Format: [ts] [level] [trace_id] [component] event: msg
///
/// `level` is one of trace|debug|info|warn|error|critical|off; an empty or
/// unrecognised value falls back to BGT_LOG_LEVEL, then to "info".
std::unique_ptr<core::ILogger> create_console_logger(const std::string &level = {});

} // namespace bgt::infra
