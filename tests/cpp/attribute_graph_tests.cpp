#include <gtest/gtest.h>
#include <stdexcept>
#include "graphsearch/core/attribute_graph.hpp"
#include "graphsearch/core/error.hpp"
#include "test_utils.hpp"

using namespace graphsearch::core;
using namespace graphsearch::core::test;

TEST(AttributeGraph, ResolvesIdentifiers) {
  auto g = make_diamond_graph();
  EXPECT_EQ(g.num_nodes(), 5);
  EXPECT_EQ(g.num_edges(), 4);
  auto a = g.find_node("A");
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(g.node_id(*a), "A");
  EXPECT_FALSE(g.find_node("Z").has_value());
  auto cd = g.find_edge("CD");
  ASSERT_TRUE(cd.has_value());
  EXPECT_EQ(g.edge_id(*cd), "CD");
}

TEST(AttributeGraph, UndirectedEdgesLeaveBothEndpoints) {
  auto g = make_diamond_graph();
  auto b_edges = g.leaving_edges(node(g, "B"));
  ASSERT_EQ(b_edges.size(), 2u);
  // Insertion order: AB then BD
  EXPECT_EQ(g.edge_id(b_edges[0]), "AB");
  EXPECT_EQ(g.edge_id(b_edges[1]), "BD");
  EXPECT_TRUE(g.leaving_edges(node(g, "E")).empty());
}

TEST(AttributeGraph, DirectedEdgesLeaveSourceOnly) {
  auto g = make_line_graph(3, /*directed=*/true);
  EXPECT_EQ(g.leaving_edges(node(g, "0")).size(), 1u);
  EXPECT_EQ(g.leaving_edges(node(g, "1")).size(), 1u);
  EXPECT_TRUE(g.leaving_edges(node(g, "2")).empty());
  EXPECT_TRUE(g.is_directed(0));
}

TEST(AttributeGraph, CsrOffsetsMonotonic) {
  auto g = make_grid_graph(3, 4);
  auto row = g.row_offsets_view();
  ASSERT_EQ(row.size(), static_cast<std::size_t>(g.num_nodes() + 1));
  for (std::size_t i = 0; i + 1 < row.size(); ++i) {
    EXPECT_LE(row[i], row[i + 1]) << "Row offsets not monotonic at " << i;
  }
  // Every undirected edge is listed twice
  EXPECT_EQ(row.back(), 2 * g.num_edges());
  EXPECT_EQ(g.adj_edge_index_view().size(), static_cast<std::size_t>(2 * g.num_edges()));
}

TEST(AttributeGraph, SelfLoopListedOnce) {
  GraphBuilder b;
  b.add_node("a");
  b.add_edge("aa", "a", "a");
  auto g = b.build();
  auto le = g.leaving_edges(0);
  ASSERT_EQ(le.size(), 1u);
  EXPECT_EQ(g.opposite(le[0], 0), std::optional<NodeId>(0));
}

TEST(AttributeGraph, OppositeEndpoint) {
  auto g = make_diamond_graph();
  auto ab = *g.find_edge("AB");
  EXPECT_EQ(g.opposite(ab, node(g, "A")), std::optional<NodeId>(node(g, "B")));
  EXPECT_EQ(g.opposite(ab, node(g, "B")), std::optional<NodeId>(node(g, "A")));
  EXPECT_FALSE(g.opposite(ab, node(g, "C")).has_value());
}

TEST(AttributeGraph, NumericAttributes) {
  auto g = make_diamond_graph();
  auto ab = *g.find_edge("AB");
  EXPECT_EQ(g.edge_number(ab, "weight"), std::optional<double>(2.0));
  EXPECT_FALSE(g.edge_number(ab, "length").has_value());
  EXPECT_FALSE(g.node_number(node(g, "A"), "x").has_value());
  EXPECT_TRUE(g.node_vector(node(g, "A"), "xy").empty());

  auto grid = make_grid_graph(2, 3);
  auto v = grid.node_vector(node(grid, grid_id(1, 2)), "xy");
  ASSERT_EQ(v.size(), 2u);
  EXPECT_DOUBLE_EQ(v[0], 2.0);
  EXPECT_DOUBLE_EQ(v[1], 1.0);
}

TEST(AttributeGraph, BuilderRejectsInvalidInput) {
  GraphBuilder b;
  b.add_node("a");
  b.add_node("b");
  EXPECT_THROW(b.add_node("a"), ValueError);
  EXPECT_THROW(b.add_edge("ax", "a", "x"), ValueError);
  b.add_edge("ab", "a", "b");
  EXPECT_THROW(b.add_edge("ab", "b", "a"), ValueError);
  EXPECT_THROW(b.set_edge_number("nope", "weight", 1.0), ValueError);
  EXPECT_THROW(b.set_edge_number("ab", "weight", std::numeric_limits<double>::infinity()), ValueError);
  EXPECT_THROW(b.set_node_number("a", "x", std::nan("")), ValueError);
  EXPECT_THROW(b.set_node_vector("zz", "xy", {0.0, 0.0}), ValueError);
}

TEST(AttributeGraph, BuilderIsSingleUse) {
  GraphBuilder b;
  b.add_node("a");
  auto g = b.build();
  EXPECT_EQ(g.num_nodes(), 1);
  EXPECT_THROW((void)b.build(), RuntimeError);
  EXPECT_THROW(b.add_node("b"), RuntimeError);
  EXPECT_THROW(b.add_edge("aa", "a", "a"), RuntimeError);
  EXPECT_THROW(b.set_node_number("a", "x", 1.0), RuntimeError);
  EXPECT_THROW(b.set_node_vector("a", "xy", {0.0, 1.0}), RuntimeError);
  EXPECT_THROW(b.set_edge_number("aa", "weight", 1.0), RuntimeError);
  // The built graph is unaffected
  EXPECT_FALSE(g.node_number(0, "x").has_value());
}

TEST(AttributeGraph, OutOfRangeIndicesThrow) {
  auto g = make_line_graph(2);
  EXPECT_THROW((void)g.leaving_edges(5), std::out_of_range);
  EXPECT_THROW((void)g.node_id(-1), std::out_of_range);
  EXPECT_THROW((void)g.endpoints(3), std::out_of_range);
}
