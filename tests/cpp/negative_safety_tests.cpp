#include <gtest/gtest.h>
#include <variant>
#include <vector>
#include "pathviz/core/shortest_paths.hpp"
#include "test_utils.hpp"

using namespace pathviz::core;
using namespace pathviz::core::test;

/**
 * Dijkstra fed negative weights.
 *
 * The distances it returns are unspecified, so these tests pin only what must
 * hold regardless: the query terminates, visited_order stays duplicate-free,
 * and any reported path runs from start to end.
 */

TEST(DijkstraNegativeWeights, TerminatesOnNegativeCycle) {
  auto g = make_negative_cycle_graph();
  auto r = compute_dijkstra(g, "P", "R");
  EXPECT_FALSE(std::holds_alternative<NegativeCycle>(r));
  expect_result_invariants(r, "P", "R");
}

TEST(DijkstraNegativeWeights, SettledNodesAreNotSettledTwice) {
  // B->A(-5) improves A after A is settled.
  auto g = make_graph({"S", "A", "B", "Z"}, {{"S", "A", 1}, {"A", "B", 1}, {"B", "A", -5}});
  auto r = compute_dijkstra(g, "S", "Z");
  ASSERT_TRUE(std::holds_alternative<Unreachable>(r));
  EXPECT_EQ(std::get<Unreachable>(r).visited_order, (std::vector<NodeId>{"A", "B"}));
}

TEST(DijkstraNegativeWeights, CyclicPredecessorChainReportsUnreachable) {
  // pred[A] flips to B after A is settled, leaving C <- A <- B <- A.
  auto g = make_graph({"S", "A", "B", "C"},
                      {{"S", "A", 1}, {"A", "B", 1}, {"A", "C", 10}, {"B", "A", -5}});
  auto r = compute_dijkstra(g, "S", "C");
  ASSERT_TRUE(std::holds_alternative<Unreachable>(r));
  expect_result_invariants(r, "S", "C");
  EXPECT_FALSE(path_contains_edge(r, "A", "C"));
}
