/*
  Cost models — weighted (Dijkstra) and Euclidean distance variants, plus the
  node position helpers the distance variant relies on.
*/
#include "graphsearch/core/cost_model.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "graphsearch/core/error.hpp"

namespace graphsearch::core {

namespace {
class WeightedCosts final : public CostModel {
public:
  explicit WeightedCosts(WeightedCostsOptions opts) : opts_(std::move(opts)) {}

  Cost heuristic(const Graph&, NodeId, NodeId) const override { return 0.0; }

  Cost cost(const Graph& g, NodeId, EdgeId edge, NodeId) const override {
    return g.edge_number(edge, opts_.weight_attribute).value_or(opts_.default_weight);
  }

private:
  WeightedCostsOptions opts_;
};

class DistanceCosts final : public CostModel {
public:
  Cost heuristic(const Graph& g, NodeId node, NodeId target) const override {
    return distance(node_position(g, node), node_position(g, target));
  }

  Cost cost(const Graph& g, NodeId, EdgeId edge, NodeId) const override {
    return edge_length(g, edge);
  }
};

void fill_from_vector(Position& p, std::span<const double> v) {
  for (std::size_t i = 0; i < v.size() && i < 3; ++i) p.xyz[i] = v[i];
  p.is_3d = v.size() > 2;
}
} // namespace

CostModelPtr make_weighted_costs(WeightedCostsOptions opts) {
  return std::make_shared<WeightedCosts>(std::move(opts));
}

CostModelPtr make_distance_costs() {
  return std::make_shared<DistanceCosts>();
}

Position node_position(const Graph& g, NodeId u) {
  Position p;
  if (auto v = g.node_vector(u, "xyz"); !v.empty()) {
    fill_from_vector(p, v);
    return p;
  }
  if (auto v = g.node_vector(u, "xy"); !v.empty()) {
    fill_from_vector(p, v);
    return p;
  }
  if (auto x = g.node_number(u, "x")) {
    p.xyz[0] = *x;
    p.xyz[1] = g.node_number(u, "y").value_or(0.0);
    if (auto z = g.node_number(u, "z")) {
      p.xyz[2] = *z;
      p.is_3d = true;
    }
    return p;
  }
  throw MissingPositionError("node '" + g.node_id(u) + "' has no position");
}

double distance(const Position& a, const Position& b) noexcept {
  const double dx = b.xyz[0] - a.xyz[0];
  const double dy = b.xyz[1] - a.xyz[1];
  const double dz = (a.is_3d && b.is_3d) ? (b.xyz[2] - a.xyz[2]) : 0.0;
  return std::sqrt(dx * dx + dy * dy + dz * dz);
}

double edge_length(const Graph& g, EdgeId e) {
  auto [a, b] = g.endpoints(e);
  return distance(node_position(g, a), node_position(g, b));
}

} // namespace graphsearch::core
