#include <gtest/gtest.h>
#include <stdexcept>
#include "graphsearch/core/error.hpp"
#include "graphsearch/core/session.hpp"
#include "test_utils.hpp"

using namespace graphsearch::core;
using namespace graphsearch::core::test;

TEST(SessionErrors, UnboundGraphFailsFast) {
  AStar astar;
  astar.set_source("A");
  astar.set_target("B");
  EXPECT_THROW(astar.compute(), UnboundGraphError);
  EXPECT_EQ(astar.state(), SearchState::Idle);
}

TEST(SessionErrors, UnknownSourceLeavesNoResult) {
  auto g = make_diamond_graph();
  AStar astar(g);
  astar.compute("A", "D");
  ASSERT_TRUE(astar.shortest_path().has_value());

  astar.set_source("Z");
  EXPECT_THROW(astar.compute(), NodeNotFoundError);
  EXPECT_FALSE(astar.shortest_path().has_value());
  EXPECT_FALSE(astar.no_path_found());
}

TEST(SessionErrors, UnknownTargetFailsAfterPreviousResultCleared) {
  auto g = make_diamond_graph();
  AStar astar(g);
  astar.compute("A", "E");
  ASSERT_TRUE(astar.no_path_found());
  // Switching the cost model keeps the old result; a failing compute drops it
  astar.set_costs(make_weighted_costs());
  ASSERT_TRUE(astar.no_path_found());
  try {
    astar.compute("A", "nowhere");
    FAIL() << "expected NodeNotFoundError";
  } catch (const NodeNotFoundError& e) {
    EXPECT_NE(std::string(e.what()).find("nowhere"), std::string::npos);
  }
  EXPECT_FALSE(astar.no_path_found());
  EXPECT_EQ(astar.state(), SearchState::Idle);
}

TEST(SessionErrors, ErrorsShareRuntimeErrorBase) {
  auto g = make_diamond_graph();
  AStar astar(g);
  EXPECT_THROW(astar.compute("X", "A"), RuntimeError);
  EXPECT_THROW(astar.compute("X", "A"), std::runtime_error);
}

TEST(SessionErrors, NullCostModelRejected) {
  AStar astar;
  EXPECT_THROW(astar.set_costs(nullptr), std::invalid_argument);
  EXPECT_NE(astar.costs(), nullptr);
}

TEST(SessionErrors, MissingPositionIsFatal) {
  auto g = make_diamond_graph();
  AStar astar(g);
  astar.set_costs(make_distance_costs());
  EXPECT_THROW(astar.compute("A", "D"), MissingPositionError);
  EXPECT_FALSE(astar.shortest_path().has_value());
}

TEST(UnsafeBehaviorsDeathTest, NegativeCostsMayNotTerminate) {
  GTEST_SKIP() << "Documents a precondition violation; negative cycles loop forever.";
  GraphBuilder b;
  b.add_node("a");
  b.add_node("b");
  b.add_node("c");
  b.add_edge("ab", "a", "b");
  b.add_edge("bc", "b", "c");
  b.set_edge_number("ab", "weight", -1.0);
  auto g = b.build();
  AStar astar(g);
  astar.compute("a", "c");
}
