/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId/EdgeId: int32 dense indices assigned at graph construction
 * - Cost: float64 (path costs and heuristic estimates are real-valued)
 * - std::span<T>: lightweight view over contiguous arrays (like memoryview, no copy)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>

namespace graphsearch::core {

// Node and edge identifiers are signed 32-bit integers. External string
// identifiers are resolved to these by the Graph.
using NodeId = std::int32_t;
using EdgeId = std::int32_t;
using Cost   = double;  // Accumulated path cost, edge cost and heuristic estimate

inline constexpr NodeId kNoNode = -1;
inline constexpr EdgeId kNoEdge = -1;

// Lifecycle of a single search run.
enum class SearchState {
  Idle = 0,       // No run yet, or state cleared by an endpoint change
  Running = 1,    // Inside astar_search (never observable from outside)
  Found = 2,      // Target reached; a path is available
  Exhausted = 3   // Open set emptied without reaching the target
};

} // namespace graphsearch::core
