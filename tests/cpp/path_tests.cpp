#include <gtest/gtest.h>
#include "graphsearch/core/path.hpp"
#include "graphsearch/core/search_store.hpp"
#include "test_utils.hpp"

using namespace graphsearch::core;
using namespace graphsearch::core::test;

TEST(BuildPath, SingleRecordYieldsSingleNode) {
  SearchStore s;
  auto src = s.open_source(5, 3.0);
  auto p = build_path(s, src);
  ASSERT_EQ(p.size(), 1u);
  EXPECT_EQ(p.nodes[0], 5);
  EXPECT_TRUE(p.edges.empty());
  EXPECT_DOUBLE_EQ(p.cost, 0.0);
}

TEST(BuildPath, WalksParentsSourceFirst) {
  SearchStore s;
  auto r0 = s.open_source(10, 0.0);
  s.close(r0);
  auto r1 = s.open_record(11, 100, r0, 1.0, 0.0);
  s.close(r1);
  auto r2 = s.open_record(12, 101, r1, 3.0, 0.0);
  auto p = build_path(s, r2);
  EXPECT_EQ(p.nodes, (std::vector<NodeId>{10, 11, 12}));
  EXPECT_EQ(p.edges, (std::vector<EdgeId>{100, 101}));
  EXPECT_DOUBLE_EQ(p.cost, 3.0);
  EXPECT_EQ(p.source(), 10);
  EXPECT_EQ(p.target(), 12);
  EXPECT_TRUE(p.contains_node(11));
  EXPECT_FALSE(p.contains_node(13));
  EXPECT_TRUE(p.contains_edge(101));
  EXPECT_FALSE(p.contains_edge(102));
}

TEST(BuildPath, FollowsReplacementRecord) {
  // Node 2 first reached via node 1, then via node 3 with a better record.
  SearchStore s;
  auto r0 = s.open_source(0, 0.0);
  s.close(r0);
  auto r1 = s.open_record(1, 0, r0, 5.0, 0.0);
  auto r3 = s.open_record(3, 1, r0, 1.0, 0.0);
  s.close(r3);
  s.open_record(2, 2, r1, 6.0, 0.0);
  auto better = s.open_record(2, 3, r3, 2.0, 0.0);
  auto p = build_path(s, better);
  EXPECT_EQ(p.nodes, (std::vector<NodeId>{0, 3, 2}));
  EXPECT_EQ(p.edges, (std::vector<EdgeId>{1, 3}));
}

TEST(PathWeight, SumsEdgeAttribute) {
  auto g = make_diamond_graph();
  Path p;
  p.nodes = {node(g, "A"), node(g, "B"), node(g, "D")};
  p.edges = {*g.find_edge("AB"), *g.find_edge("BD")};
  EXPECT_DOUBLE_EQ(path_weight(g, p, "weight"), 4.0);
  EXPECT_DOUBLE_EQ(path_weight(g, p, "missing"), 2.0);
  EXPECT_DOUBLE_EQ(path_weight(g, p, "missing", 0.5), 1.0);
  EXPECT_EQ(path_node_ids(g, p), (std::vector<std::string>{"A", "B", "D"}));
}

TEST(PathWeight, EmptyPathWeighsNothing) {
  auto g = make_diamond_graph();
  Path p;
  EXPECT_TRUE(p.empty());
  EXPECT_EQ(p.source(), kNoNode);
  EXPECT_DOUBLE_EQ(path_weight(g, p, "weight"), 0.0);
}
