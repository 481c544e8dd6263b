#include "graphsearch/core/log.hpp"

#include <cstdlib>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace graphsearch::core::log {

namespace {
std::shared_ptr<spdlog::logger> create_logger() {
  if (auto existing = spdlog::get("graphsearch")) return existing;
  auto logger = spdlog::stderr_color_mt("graphsearch");
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  logger->set_level(spdlog::level::warn);
  if (const char* env = std::getenv("GRAPHSEARCH_LOG_LEVEL")) {
    logger->set_level(level_from_name(env, spdlog::level::warn));
  }
  return logger;
}
} // namespace

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> instance;
  std::call_once(once, [] { instance = create_logger(); });
  return instance;
}

void set_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

spdlog::level::level_enum level_from_name(std::string_view name,
                                          spdlog::level::level_enum fallback) {
  const std::string text(name);
  auto level = spdlog::level::from_str(text);
  // from_str also answers off for names it does not know
  if (level == spdlog::level::off && text != "off") return fallback;
  return level;
}

} // namespace graphsearch::core::log
