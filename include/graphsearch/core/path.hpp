/* Path — result of a successful search, plus reconstruction from records. */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "graphsearch/core/graph.hpp"
#include "graphsearch/core/search_store.hpp"
#include "graphsearch/core/types.hpp"

namespace graphsearch::core {

// Ordered walk from source to target. edges[i] connects nodes[i] and
// nodes[i+1], so edges.size() == nodes.size() - 1 for a non-empty path.
// cost is the g value of the terminal record under the cost model that
// produced the path.
struct Path {
  std::vector<NodeId> nodes;
  std::vector<EdgeId> edges;
  Cost cost { 0.0 };

  // Number of nodes.
  [[nodiscard]] std::size_t size() const noexcept { return nodes.size(); }
  [[nodiscard]] bool empty() const noexcept { return nodes.empty(); }
  [[nodiscard]] NodeId source() const noexcept { return nodes.empty() ? kNoNode : nodes.front(); }
  [[nodiscard]] NodeId target() const noexcept { return nodes.empty() ? kNoNode : nodes.back(); }

  [[nodiscard]] bool contains_node(NodeId u) const noexcept;
  [[nodiscard]] bool contains_edge(EdgeId e) const noexcept;

  friend bool operator==(const Path& a, const Path& b) noexcept {
    return a.nodes == b.nodes && a.edges == b.edges && a.cost == b.cost;
  }
};

// Follow parent links from terminal back to the source record and emit the
// path source-first. A terminal with no parent yields a single-node path.
[[nodiscard]] Path build_path(const SearchStore& store, RecordIndex terminal);

// Sum of a numeric edge attribute along the path; edges lacking it count as
// default_value.
[[nodiscard]] double path_weight(const Graph& g, const Path& path,
                                 std::string_view key, double default_value = 1.0);

// External identifiers of the path's nodes, source first.
[[nodiscard]] std::vector<std::string> path_node_ids(const Graph& g, const Path& path);

} // namespace graphsearch::core
