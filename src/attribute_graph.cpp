/*
  AttributeGraph — immutable multigraph with deterministic layout.

  GraphBuilder validates inputs as they arrive (unique identifiers, known
  endpoints, finite attribute values) and build() compacts the edge list into
  CSR adjacency of leaving edges. An undirected edge is listed under both of
  its endpoints; a directed edge only under its source. Within a node, edges
  keep insertion order for reproducible traversal.
*/
#include "graphsearch/core/attribute_graph.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include "graphsearch/core/error.hpp"

namespace graphsearch::core {

std::optional<NodeId> AttributeGraph::find_node(std::string_view id) const {
  auto it = node_index_.find(std::string(id));
  if (it == node_index_.end()) return std::nullopt;
  return it->second;
}

std::optional<EdgeId> AttributeGraph::find_edge(std::string_view id) const {
  auto it = edge_index_.find(std::string(id));
  if (it == edge_index_.end()) return std::nullopt;
  return it->second;
}

void AttributeGraph::check_node(NodeId u) const {
  if (u < 0 || u >= num_nodes()) {
    throw std::out_of_range("node index out of range: " + std::to_string(u));
  }
}

void AttributeGraph::check_edge(EdgeId e) const {
  if (e < 0 || e >= num_edges()) {
    throw std::out_of_range("edge index out of range: " + std::to_string(e));
  }
}

const std::string& AttributeGraph::node_id(NodeId u) const {
  check_node(u);
  return node_ids_[static_cast<std::size_t>(u)];
}

const std::string& AttributeGraph::edge_id(EdgeId e) const {
  check_edge(e);
  return edge_ids_[static_cast<std::size_t>(e)];
}

std::span<const EdgeId> AttributeGraph::leaving_edges(NodeId u) const {
  check_node(u);
  auto start = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u)]);
  auto end   = static_cast<std::size_t>(row_offsets_[static_cast<std::size_t>(u) + 1]);
  return std::span<const EdgeId>(adj_edge_index_).subspan(start, end - start);
}

std::pair<NodeId, NodeId> AttributeGraph::endpoints(EdgeId e) const {
  check_edge(e);
  auto i = static_cast<std::size_t>(e);
  return {src_[i], dst_[i]};
}

bool AttributeGraph::is_directed(EdgeId e) const {
  check_edge(e);
  return directed_[static_cast<std::size_t>(e)] != 0;
}

std::optional<double> AttributeGraph::node_number(NodeId u, std::string_view key) const {
  check_node(u);
  const auto& attrs = node_numbers_[static_cast<std::size_t>(u)];
  auto it = attrs.find(std::string(key));
  if (it == attrs.end()) return std::nullopt;
  return it->second;
}

std::optional<double> AttributeGraph::edge_number(EdgeId e, std::string_view key) const {
  check_edge(e);
  const auto& attrs = edge_numbers_[static_cast<std::size_t>(e)];
  auto it = attrs.find(std::string(key));
  if (it == attrs.end()) return std::nullopt;
  return it->second;
}

std::span<const double> AttributeGraph::node_vector(NodeId u, std::string_view key) const {
  check_node(u);
  const auto& attrs = node_vectors_[static_cast<std::size_t>(u)];
  auto it = attrs.find(std::string(key));
  if (it == attrs.end()) return {};
  return it->second;
}

// ---------------------------------------------------------------------------
// GraphBuilder

NodeId GraphBuilder::require_node(std::string_view id, const char* what) const {
  auto u = g_.find_node(id);
  if (!u) {
    throw ValueError(std::string(what) + ": unknown node '" + std::string(id) + "'");
  }
  return *u;
}

NodeId GraphBuilder::add_node(std::string id) {
  if (built_) throw RuntimeError("GraphBuilder::add_node: builder already consumed");
  if (g_.node_index_.count(id) != 0) {
    throw ValueError("GraphBuilder::add_node: duplicate node '" + id + "'");
  }
  auto u = static_cast<NodeId>(g_.node_ids_.size());
  g_.node_index_.emplace(id, u);
  g_.node_ids_.push_back(std::move(id));
  g_.node_numbers_.emplace_back();
  g_.node_vectors_.emplace_back();
  return u;
}

EdgeId GraphBuilder::add_edge(std::string id, std::string_view from, std::string_view to,
                              bool directed) {
  if (built_) throw RuntimeError("GraphBuilder::add_edge: builder already consumed");
  if (g_.edge_index_.count(id) != 0) {
    throw ValueError("GraphBuilder::add_edge: duplicate edge '" + id + "'");
  }
  NodeId s = require_node(from, "GraphBuilder::add_edge");
  NodeId d = require_node(to, "GraphBuilder::add_edge");
  auto e = static_cast<EdgeId>(g_.edge_ids_.size());
  g_.edge_index_.emplace(id, e);
  g_.edge_ids_.push_back(std::move(id));
  g_.src_.push_back(s);
  g_.dst_.push_back(d);
  g_.directed_.push_back(directed ? 1 : 0);
  g_.edge_numbers_.emplace_back();
  return e;
}

GraphBuilder& GraphBuilder::set_node_number(std::string_view node, std::string key, double value) {
  if (built_) throw RuntimeError("GraphBuilder::set_node_number: builder already consumed");
  if (!std::isfinite(value)) {
    throw ValueError("GraphBuilder::set_node_number: value for '" + key + "' must be finite");
  }
  NodeId u = require_node(node, "GraphBuilder::set_node_number");
  g_.node_numbers_[static_cast<std::size_t>(u)][std::move(key)] = value;
  return *this;
}

GraphBuilder& GraphBuilder::set_node_vector(std::string_view node, std::string key,
                                            std::vector<double> values) {
  if (built_) throw RuntimeError("GraphBuilder::set_node_vector: builder already consumed");
  for (double v : values) {
    if (!std::isfinite(v)) {
      throw ValueError("GraphBuilder::set_node_vector: values for '" + key + "' must be finite");
    }
  }
  NodeId u = require_node(node, "GraphBuilder::set_node_vector");
  g_.node_vectors_[static_cast<std::size_t>(u)][std::move(key)] = std::move(values);
  return *this;
}

GraphBuilder& GraphBuilder::set_edge_number(std::string_view edge, std::string key, double value) {
  if (built_) throw RuntimeError("GraphBuilder::set_edge_number: builder already consumed");
  if (!std::isfinite(value)) {
    throw ValueError("GraphBuilder::set_edge_number: value for '" + key + "' must be finite");
  }
  auto e = g_.find_edge(edge);
  if (!e) {
    throw ValueError("GraphBuilder::set_edge_number: unknown edge '" + std::string(edge) + "'");
  }
  g_.edge_numbers_[static_cast<std::size_t>(*e)][std::move(key)] = value;
  return *this;
}

AttributeGraph GraphBuilder::build() {
  if (built_) throw RuntimeError("GraphBuilder::build: builder already consumed");
  built_ = true;

  AttributeGraph& g = g_;
  const auto n = static_cast<std::size_t>(g.num_nodes());
  const auto m = static_cast<std::size_t>(g.num_edges());

  // Count leaving entries per node
  g.row_offsets_.assign(n + 1, 0);
  for (std::size_t e = 0; e < m; ++e) {
    g.row_offsets_[static_cast<std::size_t>(g.src_[e]) + 1]++;
    // Undirected self-loops are listed once
    if (!g.directed_[e] && g.dst_[e] != g.src_[e]) {
      g.row_offsets_[static_cast<std::size_t>(g.dst_[e]) + 1]++;
    }
  }
  for (std::size_t i = 1; i < g.row_offsets_.size(); ++i) {
    g.row_offsets_[i] += g.row_offsets_[i - 1];
  }
  g.adj_edge_index_.resize(static_cast<std::size_t>(g.row_offsets_.back()));
  // We need a copy of offsets to fill in-place
  std::vector<std::int32_t> cursor = g.row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto u = static_cast<std::size_t>(g.src_[e]);
    g.adj_edge_index_[static_cast<std::size_t>(cursor[u]++)] = static_cast<EdgeId>(e);
    if (!g.directed_[e] && g.dst_[e] != g.src_[e]) {
      auto v = static_cast<std::size_t>(g.dst_[e]);
      g.adj_edge_index_[static_cast<std::size_t>(cursor[v]++)] = static_cast<EdgeId>(e);
    }
  }
  return std::move(g_);
}

} // namespace graphsearch::core
