/*
  AStar — stateful search session over a bound graph.

  Typical use:
    AStar astar(graph);
    astar.compute("A", "Z");
    if (const auto& path = astar.shortest_path()) { ... }

  The session is not thread-safe; serialize calls or use one session per
  thread. The graph must outlive the session and stay unchanged while
  compute() runs.
*/
#pragma once

#include <optional>
#include <string>

#include "graphsearch/core/astar.hpp"
#include "graphsearch/core/cost_model.hpp"
#include "graphsearch/core/graph.hpp"
#include "graphsearch/core/path.hpp"
#include "graphsearch/core/types.hpp"

namespace graphsearch::core {

class AStar {
public:
  // Unbound session with weighted costs on attribute "weight".
  AStar();
  explicit AStar(const Graph& g);
  AStar(const Graph& g, std::string source, std::string target);

  // Bind (or rebind) the graph. Clears any computed result.
  void init(const Graph& g);

  // Change one endpoint. Clears any computed result; the other endpoint and
  // the cost model are kept.
  void set_source(std::string id);
  void set_target(std::string id);

  // Replace the cost model. Does NOT clear the computed result; call
  // compute() again to refresh it. Throws std::invalid_argument on null.
  void set_costs(CostModelPtr costs);
  [[nodiscard]] const CostModelPtr& costs() const noexcept { return costs_; }

  // Run the search if both endpoints are set; silently does nothing
  // otherwise. Throws UnboundGraphError without a graph and
  // NodeNotFoundError if an endpoint does not resolve; in both cases the
  // previous result has already been cleared.
  void compute();

  // set_source(source), set_target(target), then compute().
  void compute(std::string source, std::string target);

  // The computed path, or std::nullopt if no run found one.
  [[nodiscard]] const std::optional<Path>& shortest_path() const noexcept { return result_; }

  // True exactly when the last run ended without reaching the target.
  [[nodiscard]] bool no_path_found() const noexcept { return state_ == SearchState::Exhausted; }

  [[nodiscard]] SearchState state() const noexcept { return state_; }
  [[nodiscard]] const SearchStats& stats() const noexcept { return stats_; }
  [[nodiscard]] const std::optional<std::string>& source() const noexcept { return source_; }
  [[nodiscard]] const std::optional<std::string>& target() const noexcept { return target_; }
  [[nodiscard]] const Graph* graph() const noexcept { return g_; }

private:
  void clear_all() noexcept;
  [[nodiscard]] NodeId resolve(const std::string& id, const char* role) const;

  const Graph* g_ {nullptr};
  std::optional<std::string> source_ {};
  std::optional<std::string> target_ {};
  CostModelPtr costs_ {};

  // Per-run outcome; reset whenever an endpoint or the graph changes.
  SearchState state_ {SearchState::Idle};
  std::optional<Path> result_ {};
  SearchStats stats_ {};
};

} // namespace graphsearch::core
