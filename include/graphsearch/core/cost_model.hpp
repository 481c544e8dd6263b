/*
  CostModel — pluggable (heuristic, edge cost) pair consulted by the engine.

  The engine assumes both functions return finite non-negative values and
  that heuristic() never overestimates the true remaining cost. Neither
  property is checked at runtime; violating them forfeits optimality (and,
  for negative costs, termination).

  For Python developers:
  - std::shared_ptr<const T>: shared immutable reference (like a frozen object)
*/
#pragma once

#include <array>
#include <memory>
#include <string>

#include "graphsearch/core/graph.hpp"
#include "graphsearch/core/types.hpp"

namespace graphsearch::core {

class CostModel {
public:
  virtual ~CostModel() noexcept = default;

  // Estimated cost from node to target.
  [[nodiscard]] virtual Cost heuristic(const Graph& g, NodeId node, NodeId target) const = 0;

  // Cost of moving from parent to next over edge (edge is the one that
  // leaves parent, relevant for multigraphs).
  [[nodiscard]] virtual Cost cost(const Graph& g, NodeId parent, EdgeId edge, NodeId next) const = 0;
};

using CostModelPtr = std::shared_ptr<const CostModel>;

struct WeightedCostsOptions {
  // Edge attribute holding the traversal cost.
  std::string weight_attribute { "weight" };
  // Used when an edge lacks weight_attribute.
  Cost default_weight { 1.0 };
};

// Zero heuristic (Dijkstra) with per-edge weights read from an attribute.
[[nodiscard]] CostModelPtr make_weighted_costs(WeightedCostsOptions opts = {});

// Straight-line distance heuristic; edge cost is the edge's geometric length.
// Every node reached must carry a position (see node_position).
[[nodiscard]] CostModelPtr make_distance_costs();

struct Position {
  std::array<double, 3> xyz { 0.0, 0.0, 0.0 };
  bool is_3d { false };
};

// Node position resolved from, in order: "xyz", "xy", or separate "x", "y",
// "z" numbers. Missing components are 0, so 2D positions have z == 0.
// Throws MissingPositionError if none of these attributes is present.
[[nodiscard]] Position node_position(const Graph& g, NodeId u);

// Euclidean distance between positions; z is ignored unless both are 3D.
[[nodiscard]] double distance(const Position& a, const Position& b) noexcept;

// Euclidean distance between the two endpoints of e.
[[nodiscard]] double edge_length(const Graph& g, EdgeId e);

} // namespace graphsearch::core
