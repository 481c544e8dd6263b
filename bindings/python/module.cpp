/*
  Pybind11 module exposing GraphSearch-Core C++ APIs to Python.

  Notes:
    - Graphs are immutable once built; GraphBuilder is the only way to create
      one from Python.
    - AStar keeps a raw reference to its graph, so the bound graph is kept
      alive for as long as the session (py::keep_alive).
    - Core exceptions are translated to dedicated Python exception types
      deriving from the closest builtin.
*/
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

#include "graphsearch/core/astar.hpp"
#include "graphsearch/core/attribute_graph.hpp"
#include "graphsearch/core/cost_model.hpp"
#include "graphsearch/core/error.hpp"
#include "graphsearch/core/log.hpp"
#include "graphsearch/core/path.hpp"
#include "graphsearch/core/session.hpp"
#include "graphsearch/core/types.hpp"

namespace py = pybind11;
using namespace graphsearch::core;

// Resolve a Python-side node identifier or raise NodeNotFoundError.
static NodeId require_node(const AttributeGraph& g, const std::string& id) {
  auto u = g.find_node(id);
  if (!u) throw NodeNotFoundError("node '" + id + "' does not exist in the graph");
  return *u;
}

PYBIND11_MODULE(_graphsearch_core, m) {
  m.doc() = "GraphSearch-Core C++ bindings";

  py::register_exception<ValueError>(m, "ValueError", PyExc_ValueError);
  py::register_exception<TypeError>(m, "TypeError", PyExc_TypeError);
  auto runtime_error = py::register_exception<RuntimeError>(m, "RuntimeError", PyExc_RuntimeError);
  py::register_exception<UnboundGraphError>(m, "UnboundGraphError", runtime_error.ptr());
  py::register_exception<NodeNotFoundError>(m, "NodeNotFoundError", runtime_error.ptr());
  py::register_exception<MissingPositionError>(m, "MissingPositionError", runtime_error.ptr());

  m.def("set_log_level", [](const std::string& level) {
    log::set_level(spdlog::level::from_str(level));
  }, py::arg("level"));

  py::enum_<SearchState>(m, "SearchState")
      .value("IDLE", SearchState::Idle)
      .value("RUNNING", SearchState::Running)
      .value("FOUND", SearchState::Found)
      .value("EXHAUSTED", SearchState::Exhausted);

  py::class_<AttributeGraph>(m, "AttributeGraph")
      .def("num_nodes", &AttributeGraph::num_nodes)
      .def("num_edges", &AttributeGraph::num_edges)
      .def("find_node", &AttributeGraph::find_node, py::arg("id"))
      .def("find_edge", &AttributeGraph::find_edge, py::arg("id"))
      .def("node_id", &AttributeGraph::node_id, py::arg("node"))
      .def("edge_id", &AttributeGraph::edge_id, py::arg("edge"))
      .def("endpoints", &AttributeGraph::endpoints, py::arg("edge"))
      .def("is_directed", &AttributeGraph::is_directed, py::arg("edge"))
      .def("leaving_edges", [](const AttributeGraph& g, NodeId u) {
        auto s = g.leaving_edges(u);
        return std::vector<EdgeId>(s.begin(), s.end());
      }, py::arg("node"))
      .def("opposite", &AttributeGraph::opposite, py::arg("edge"), py::arg("node"))
      .def("node_number", [](const AttributeGraph& g, NodeId u, const std::string& key) {
        return g.node_number(u, key);
      }, py::arg("node"), py::arg("key"))
      .def("edge_number", [](const AttributeGraph& g, EdgeId e, const std::string& key) {
        return g.edge_number(e, key);
      }, py::arg("edge"), py::arg("key"))
      .def("node_vector", [](const AttributeGraph& g, NodeId u, const std::string& key) {
        auto s = g.node_vector(u, key);
        return std::vector<double>(s.begin(), s.end());
      }, py::arg("node"), py::arg("key"));

  py::class_<GraphBuilder>(m, "GraphBuilder")
      .def(py::init<>())
      .def("add_node", &GraphBuilder::add_node, py::arg("id"))
      .def("add_edge", [](GraphBuilder& b, std::string id, const std::string& from,
                          const std::string& to, bool directed) {
        return b.add_edge(std::move(id), from, to, directed);
      }, py::arg("id"), py::arg("from_node"), py::arg("to_node"),
         py::kw_only(), py::arg("directed") = false)
      .def("set_node_number", [](GraphBuilder& b, const std::string& node, std::string key, double v) {
        b.set_node_number(node, std::move(key), v);
      }, py::arg("node"), py::arg("key"), py::arg("value"))
      .def("set_node_vector", [](GraphBuilder& b, const std::string& node, std::string key,
                                 std::vector<double> values) {
        b.set_node_vector(node, std::move(key), std::move(values));
      }, py::arg("node"), py::arg("key"), py::arg("values"))
      .def("set_edge_number", [](GraphBuilder& b, const std::string& edge, std::string key, double v) {
        b.set_edge_number(edge, std::move(key), v);
      }, py::arg("edge"), py::arg("key"), py::arg("value"))
      .def("build", &GraphBuilder::build);

  py::class_<Path>(m, "Path")
      .def_readonly("nodes", &Path::nodes)
      .def_readonly("edges", &Path::edges)
      .def_readonly("cost", &Path::cost)
      .def("__len__", &Path::size)
      .def("contains_node", &Path::contains_node, py::arg("node"))
      .def("contains_edge", &Path::contains_edge, py::arg("edge"))
      .def("node_ids", [](const Path& p, const AttributeGraph& g) {
        return path_node_ids(g, p);
      }, py::arg("graph"))
      .def("weight", [](const Path& p, const AttributeGraph& g, const std::string& key, double dflt) {
        return path_weight(g, p, key, dflt);
      }, py::arg("graph"), py::arg("key") = "weight", py::arg("default") = 1.0)
      .def("__eq__", [](const Path& a, const Path& b) { return a == b; });

  py::class_<SearchStats>(m, "SearchStats")
      .def_readonly("expansions", &SearchStats::expansions)
      .def_readonly("relaxations", &SearchStats::relaxations)
      .def_readonly("reopenings", &SearchStats::reopenings)
      .def_readonly("max_open", &SearchStats::max_open);

  py::class_<SearchResult>(m, "SearchResult")
      .def_readonly("state", &SearchResult::state)
      .def_readonly("path", &SearchResult::path)
      .def_readonly("stats", &SearchResult::stats);

  py::class_<CostModel, std::shared_ptr<CostModel>>(m, "CostModel")
      .def("heuristic", [](const CostModel& c, const AttributeGraph& g, NodeId node, NodeId target) {
        return c.heuristic(g, node, target);
      }, py::arg("graph"), py::arg("node"), py::arg("target"))
      .def("cost", [](const CostModel& c, const AttributeGraph& g, NodeId parent, EdgeId edge, NodeId next) {
        return c.cost(g, parent, edge, next);
      }, py::arg("graph"), py::arg("parent"), py::arg("edge"), py::arg("next"));

  m.def("make_weighted_costs", [](std::string weight_attribute, Cost default_weight) {
    WeightedCostsOptions opts;
    opts.weight_attribute = std::move(weight_attribute);
    opts.default_weight = default_weight;
    return std::const_pointer_cast<CostModel>(make_weighted_costs(std::move(opts)));
  }, py::kw_only(), py::arg("weight_attribute") = "weight", py::arg("default_weight") = 1.0);

  m.def("make_distance_costs", []() {
    return std::const_pointer_cast<CostModel>(make_distance_costs());
  });

  m.def("astar_search", [](const AttributeGraph& g, const std::string& source,
                           const std::string& target, std::shared_ptr<CostModel> costs) {
    if (!costs) throw py::value_error("costs must not be None");
    return astar_search(g, require_node(g, source), require_node(g, target), *costs);
  }, py::arg("graph"), py::arg("source"), py::arg("target"), py::arg("costs"));

  py::class_<AStar>(m, "AStar")
      .def(py::init<>())
      .def(py::init<const AttributeGraph&>(), py::arg("graph"), py::keep_alive<1, 2>())
      .def(py::init<const AttributeGraph&, std::string, std::string>(),
           py::arg("graph"), py::arg("source"), py::arg("target"), py::keep_alive<1, 2>())
      .def("init", [](AStar& a, const AttributeGraph& g) { a.init(g); },
           py::arg("graph"), py::keep_alive<1, 2>())
      .def("set_source", &AStar::set_source, py::arg("id"))
      .def("set_target", &AStar::set_target, py::arg("id"))
      .def("set_costs", [](AStar& a, std::shared_ptr<CostModel> costs) {
        a.set_costs(std::move(costs));
      }, py::arg("costs"))
      .def("compute", py::overload_cast<>(&AStar::compute))
      .def("compute", py::overload_cast<std::string, std::string>(&AStar::compute),
           py::arg("source"), py::arg("target"))
      .def("shortest_path", &AStar::shortest_path)
      .def("no_path_found", &AStar::no_path_found)
      .def_property_readonly("state", &AStar::state)
      .def_property_readonly("stats", &AStar::stats)
      .def_property_readonly("source", &AStar::source)
      .def_property_readonly("target", &AStar::target);
}
