#include "confq/logging.h"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "util/string_util.h"

namespace confq::log {

namespace {

std::mutex g_init_mu;

spdlog::level::level_enum parse_level(const std::string& raw) {
  const std::string level = util::to_lower(util::trim_ws(raw));
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn" || level == "warning") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::warn;
}

std::shared_ptr<spdlog::logger> get_or_create() {
  auto existing = spdlog::get(kLoggerName);
  if (existing) return existing;
  // stdout carries query results; diagnostics go to stderr only.
  auto created = spdlog::stderr_color_mt(kLoggerName);
  created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  created->set_level(spdlog::level::warn);
  return created;
}

}  // namespace

void init(const std::string& level) {
  std::lock_guard<std::mutex> lock(g_init_mu);
  get_or_create()->set_level(parse_level(level));
}

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(g_init_mu);
  return get_or_create();
}

}  // namespace confq::log
