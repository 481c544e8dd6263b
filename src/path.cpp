#include "graphsearch/core/path.hpp"

#include <algorithm>
#include <string>

namespace graphsearch::core {

bool Path::contains_node(NodeId u) const noexcept {
  return std::find(nodes.begin(), nodes.end(), u) != nodes.end();
}

bool Path::contains_edge(EdgeId e) const noexcept {
  return std::find(edges.begin(), edges.end(), e) != edges.end();
}

Path build_path(const SearchStore& store, RecordIndex terminal) {
  Path path;
  path.cost = store.record(terminal).g;
  for (RecordIndex r = terminal; r != kNoRecord; r = store.record(r).parent) {
    const auto& rec = store.record(r);
    path.nodes.push_back(rec.node);
    if (rec.via_edge != kNoEdge) path.edges.push_back(rec.via_edge);
  }
  std::reverse(path.nodes.begin(), path.nodes.end());
  std::reverse(path.edges.begin(), path.edges.end());
  return path;
}

double path_weight(const Graph& g, const Path& path, std::string_view key, double default_value) {
  double total = 0.0;
  for (auto e : path.edges) total += g.edge_number(e, key).value_or(default_value);
  return total;
}

std::vector<std::string> path_node_ids(const Graph& g, const Path& path) {
  std::vector<std::string> out;
  out.reserve(path.nodes.size());
  for (auto u : path.nodes) out.push_back(g.node_id(u));
  return out;
}

} // namespace graphsearch::core
