#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace confq::log {

constexpr const char* kLoggerName = "confq";

/// Installs the "confq" logger writing to stderr at the given level
/// ("trace", "debug", "info", "warn", "error", "off"). Unknown names fall back to warn.
/// Safe to call more than once; later calls only change the level.
void init(const std::string& level);

/// Returns the "confq" logger, creating it with defaults when init() was never called.
std::shared_ptr<spdlog::logger> logger();

}  // namespace confq::log
