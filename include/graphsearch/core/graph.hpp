/*
  Graph interface — read-only view consumed by the search engine.

  The engine never owns or mutates the graph. Implementations must keep the
  returned spans and strings valid for the graph's lifetime.

  For Python developers:
  - virtual ... = 0: pure virtual (must be implemented by subclass, like @abstractmethod)
  - std::string_view: non-owning string reference (no copy)
*/
#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "graphsearch/core/types.hpp"

namespace graphsearch::core {

class Graph {
public:
  virtual ~Graph() noexcept = default;

  [[nodiscard]] virtual std::int32_t num_nodes() const noexcept = 0;
  [[nodiscard]] virtual std::int32_t num_edges() const noexcept = 0;

  // Resolve an external identifier; std::nullopt if no such node.
  [[nodiscard]] virtual std::optional<NodeId> find_node(std::string_view id) const = 0;

  [[nodiscard]] virtual const std::string& node_id(NodeId u) const = 0;
  [[nodiscard]] virtual const std::string& edge_id(EdgeId e) const = 0;

  // Edges that can be traversed starting at u. Undirected edges leave from
  // both endpoints, directed edges from their source only.
  [[nodiscard]] virtual std::span<const EdgeId> leaving_edges(NodeId u) const = 0;

  // (node0, node1) as given at construction; node0 is the source of a
  // directed edge.
  [[nodiscard]] virtual std::pair<NodeId, NodeId> endpoints(EdgeId e) const = 0;

  [[nodiscard]] virtual bool is_directed(EdgeId e) const = 0;

  // Numeric attributes. std::nullopt when the key is absent.
  [[nodiscard]] virtual std::optional<double> node_number(NodeId u, std::string_view key) const = 0;
  [[nodiscard]] virtual std::optional<double> edge_number(EdgeId e, std::string_view key) const = 0;

  // Multi-component numeric attribute ("xy", "xyz"); empty span when absent.
  [[nodiscard]] virtual std::span<const double> node_vector(NodeId u, std::string_view key) const = 0;

  // Endpoint of e other than u, or std::nullopt if u is not an endpoint.
  // A self-loop returns u.
  [[nodiscard]] std::optional<NodeId> opposite(EdgeId e, NodeId u) const {
    auto [a, b] = endpoints(e);
    if (u == a) return b;
    if (u == b) return a;
    return std::nullopt;
  }
};

} // namespace graphsearch::core
