#include "graphsearch/core/session.hpp"

#include <stdexcept>
#include <utility>

#include "graphsearch/core/error.hpp"
#include "graphsearch/core/log.hpp"

namespace graphsearch::core {

AStar::AStar() : costs_(make_weighted_costs()) {}

AStar::AStar(const Graph& g) : AStar() { init(g); }

AStar::AStar(const Graph& g, std::string source, std::string target) : AStar(g) {
  set_source(std::move(source));
  set_target(std::move(target));
}

void AStar::clear_all() noexcept {
  state_ = SearchState::Idle;
  result_.reset();
  stats_ = {};
}

void AStar::init(const Graph& g) {
  clear_all();
  g_ = &g;
}

void AStar::set_source(std::string id) {
  clear_all();
  source_ = std::move(id);
}

void AStar::set_target(std::string id) {
  clear_all();
  target_ = std::move(id);
}

void AStar::set_costs(CostModelPtr costs) {
  if (!costs) throw std::invalid_argument("AStar::set_costs: cost model must not be null");
  costs_ = std::move(costs);
}

NodeId AStar::resolve(const std::string& id, const char* role) const {
  auto u = g_->find_node(id);
  if (!u) {
    log::logger()->error("astar: {} node '{}' does not exist in the graph", role, id);
    throw NodeNotFoundError(std::string(role) + " node '" + id + "' does not exist in the graph");
  }
  return *u;
}

void AStar::compute() {
  if (!source_ || !target_) return;
  clear_all();
  if (g_ == nullptr) {
    log::logger()->error("astar: compute called before a graph was bound");
    throw UnboundGraphError("AStar::compute: no graph bound (call init first)");
  }
  const NodeId src = resolve(*source_, "source");
  const NodeId dst = resolve(*target_, "target");

  auto res = astar_search(*g_, src, dst, *costs_);
  state_ = res.state;
  result_ = std::move(res.path);
  stats_ = res.stats;
}

void AStar::compute(std::string source, std::string target) {
  set_source(std::move(source));
  set_target(std::move(target));
  compute();
}

} // namespace graphsearch::core
