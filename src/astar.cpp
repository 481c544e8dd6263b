/*
  astar — best-first search with open/closed record sets.

  Each run owns a fresh SearchStore. The loop selects the open record with the
  lowest rank (g + h), stops as soon as that record is the target, and
  otherwise closes it and relaxes its leaving edges. Closed nodes are
  re-opened only on strict rank improvement, which bounds re-expansions when
  costs are non-negative.
*/
#include "graphsearch/core/astar.hpp"

#include <algorithm>

#include "graphsearch/core/log.hpp"
#include "graphsearch/core/search_store.hpp"

namespace graphsearch::core {

SearchResult astar_search(const Graph& g, NodeId source, NodeId target,
                          const CostModel& costs) {
  auto logger = log::logger();
  SearchResult result;
  result.state = SearchState::Running;
  SearchStats& stats = result.stats;

  SearchStore store;
  store.open_source(source, costs.heuristic(g, source, target));
  stats.max_open = 1;
  logger->debug("astar: start {} -> {}", g.node_id(source), g.node_id(target));

  while (auto best = store.peek_best()) {
    const RecordIndex cur_idx = *best;
    // Copy: the arena may reallocate while we push new records below.
    const SearchRecord cur = store.record(cur_idx);

    if (cur.node == target) {
      result.path = build_path(store, cur_idx);
      result.state = SearchState::Found;
      logger->debug("astar: found {} -> {} cost={} edges={} expansions={}",
                    g.node_id(source), g.node_id(target), result.path->cost,
                    result.path->edges.size(), stats.expansions);
      return result;
    }

    store.close(cur_idx);
    ++stats.expansions;
    logger->trace("astar: expand {} g={} h={} rank={}", g.node_id(cur.node), cur.g, cur.h, cur.rank);

    for (EdgeId e : g.leaving_edges(cur.node)) {
      auto next_opt = g.opposite(e, cur.node);
      if (!next_opt) continue;
      const NodeId next = *next_opt;
      ++stats.relaxations;

      const Cost h = costs.heuristic(g, next, target);
      const Cost ng = cur.g + costs.cost(g, cur.node, e, next);
      const Cost rank = ng + h;

      if (auto o = store.find_open(next); o && store.record(*o).rank <= rank) continue;
      auto c = store.find_closed(next);
      if (c && store.record(*c).rank <= rank) continue;
      if (c) ++stats.reopenings;

      store.open_record(next, e, cur_idx, ng, h);
      stats.max_open = std::max(stats.max_open, store.open_size());
    }
  }

  result.state = SearchState::Exhausted;
  logger->debug("astar: no path {} -> {} after {} expansions",
                g.node_id(source), g.node_id(target), stats.expansions);
  return result;
}

} // namespace graphsearch::core
