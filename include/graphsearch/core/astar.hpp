/* A* best-first search over a Graph; Dijkstra when the heuristic is zero. */
#pragma once

#include <cstddef>
#include <optional>

#include "graphsearch/core/cost_model.hpp"
#include "graphsearch/core/graph.hpp"
#include "graphsearch/core/path.hpp"
#include "graphsearch/core/types.hpp"

namespace graphsearch::core {

// Counters collected during one run.
struct SearchStats {
  std::size_t expansions { 0 };   // Records moved from open to closed
  std::size_t relaxations { 0 };  // Leaving edges examined
  std::size_t reopenings { 0 };   // Closed nodes moved back to open
  std::size_t max_open { 0 };     // Peak open-set size
};

struct SearchResult {
  SearchState state { SearchState::Idle };
  std::optional<Path> path {};  // Set iff state == Found
  SearchStats stats {};
};

// Run A* from source to target. Returns Found with the path on success and
// Exhausted when the open set empties first. Optimal when edge costs are
// non-negative and the heuristic is admissible; neither is verified.
//
// A neighbor is skipped when its open or closed record already has
// rank <= the new rank; otherwise any closed record is discarded (re-opened)
// and the new record replaces the open one.
[[nodiscard]] SearchResult astar_search(const Graph& g, NodeId source, NodeId target,
                                        const CostModel& costs);

} // namespace graphsearch::core
