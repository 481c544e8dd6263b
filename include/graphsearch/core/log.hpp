/* Library logger. */
#pragma once

#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace graphsearch::core::log {

// Named logger "graphsearch" writing to stderr. Created on first use at level
// warn, or at the level named by GRAPHSEARCH_LOG_LEVEL if that is set.
std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

// Parses a spdlog level name ("trace" ... "off"). Unrecognised names yield
// `fallback`.
spdlog::level::level_enum level_from_name(std::string_view name,
                                          spdlog::level::level_enum fallback);

} // namespace graphsearch::core::log
