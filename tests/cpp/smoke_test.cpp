#include <gtest/gtest.h>
#include <vector>
#include "pathviz/core/graph.hpp"

using namespace pathviz::core;

TEST(GraphSmoke, ConstructFromEdges) {
  std::vector<NodeId> nodes = {"a", "b", "c"};
  std::vector<EdgeSpec> edges = {{"a", "b", 0.5}, {"b", "c", 1.5}};
  auto g = Graph::from_edges(nodes, edges);
  EXPECT_EQ(g.num_nodes(), 3);
  EXPECT_EQ(g.num_edges(), 2);
}
