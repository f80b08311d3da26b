#include "pathviz/core/demo_graph.hpp"

#include <vector>

namespace pathviz::core {

Graph make_demo_graph() {
  const std::vector<NodeId> nodes = {"A", "B", "C", "D", "E"};
  const std::vector<EdgeSpec> edges = {
    {"A", "B", 4}, {"A", "E", 2}, {"B", "C", 3}, {"B", "D", 1},
    {"C", "D", 2}, {"D", "E", 3}, {"E", "B", 7},
  };
  return Graph::from_edges(nodes, edges);
}

} // namespace pathviz::core
