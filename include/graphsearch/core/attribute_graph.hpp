/* Immutable multigraph with CSR leaving-edge adjacency and numeric attributes. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "graphsearch/core/graph.hpp"
#include "graphsearch/core/types.hpp"

namespace graphsearch::core {

// Notes on identifiers:
// - NodeId/EdgeId are dense indices in insertion order. External string
//   identifiers are kept alongside and resolved through find_node().
// - Leaving edges of a node keep edge insertion order, so traversal is
//   deterministic for a given construction sequence.

class AttributeGraph final : public Graph {
public:
  [[nodiscard]] std::int32_t num_nodes() const noexcept override {
    return static_cast<std::int32_t>(node_ids_.size());
  }
  [[nodiscard]] std::int32_t num_edges() const noexcept override {
    return static_cast<std::int32_t>(edge_ids_.size());
  }

  [[nodiscard]] std::optional<NodeId> find_node(std::string_view id) const override;
  [[nodiscard]] std::optional<EdgeId> find_edge(std::string_view id) const;

  [[nodiscard]] const std::string& node_id(NodeId u) const override;
  [[nodiscard]] const std::string& edge_id(EdgeId e) const override;

  [[nodiscard]] std::span<const EdgeId> leaving_edges(NodeId u) const override;
  [[nodiscard]] std::pair<NodeId, NodeId> endpoints(EdgeId e) const override;
  [[nodiscard]] bool is_directed(EdgeId e) const override;

  [[nodiscard]] std::optional<double> node_number(NodeId u, std::string_view key) const override;
  [[nodiscard]] std::optional<double> edge_number(EdgeId e, std::string_view key) const override;
  [[nodiscard]] std::span<const double> node_vector(NodeId u, std::string_view key) const override;

  // CSR views (row_offsets has length num_nodes()+1).
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const EdgeId> adj_edge_index_view() const noexcept { return adj_edge_index_; }

private:
  friend class GraphBuilder;
  AttributeGraph() = default;

  using NumberMap = std::unordered_map<std::string, double>;
  using VectorMap = std::unordered_map<std::string, std::vector<double>>;

  void check_node(NodeId u) const;
  void check_edge(EdgeId e) const;

  std::vector<std::string> node_ids_ {};
  std::vector<std::string> edge_ids_ {};
  std::unordered_map<std::string, NodeId> node_index_ {};
  std::unordered_map<std::string, EdgeId> edge_index_ {};

  std::vector<NodeId> src_ {};
  std::vector<NodeId> dst_ {};
  std::vector<std::uint8_t> directed_ {};

  std::vector<NumberMap> node_numbers_ {};
  std::vector<VectorMap> node_vectors_ {};
  std::vector<NumberMap> edge_numbers_ {};

  // CSR adjacency of leaving edges (an undirected edge appears under both ends)
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<EdgeId> adj_edge_index_ {};
};

// Accumulates nodes, edges and attributes, then compacts them into an
// AttributeGraph. Validation happens eagerly on each call; build() can be
// called once per builder.
class GraphBuilder {
public:
  GraphBuilder() = default;

  NodeId add_node(std::string id);
  EdgeId add_edge(std::string id, std::string_view from, std::string_view to,
                  bool directed = false);

  GraphBuilder& set_node_number(std::string_view node, std::string key, double value);
  GraphBuilder& set_node_vector(std::string_view node, std::string key, std::vector<double> values);
  GraphBuilder& set_edge_number(std::string_view edge, std::string key, double value);

  [[nodiscard]] AttributeGraph build();

private:
  NodeId require_node(std::string_view id, const char* what) const;

  AttributeGraph g_ {};
  bool built_ {false};
};

} // namespace graphsearch::core
