#pragma once

#include <gtest/gtest.h>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include "pathviz/core/graph.hpp"
#include "pathviz/core/result.hpp"
#include "pathviz/core/shortest_paths.hpp"

namespace pathviz::core::test {

inline Graph make_graph(const std::vector<NodeId>& nodes, const std::vector<EdgeSpec>& edges) {
  return Graph::from_edges(nodes, edges);
}

// Line graph n0->n1->...->n{k-1}, unit weights.
inline Graph make_line_graph(int n) {
  std::vector<NodeId> nodes;
  std::vector<EdgeSpec> edges;
  for (int i = 0; i < n; ++i) nodes.push_back("n" + std::to_string(i));
  for (int i = 0; i + 1 < n; ++i) edges.push_back({nodes[i], nodes[i + 1], 1.0});
  return make_graph(nodes, edges);
}

// S reaches C through A or B at equal cost 2. The S->B edge is inserted
// before S->A so insertion order disagrees with id order.
inline Graph make_tie_graph() {
  return make_graph({"S", "A", "B", "C"},
                    {{"S", "B", 1}, {"S", "A", 1}, {"B", "C", 1}, {"A", "C", 1}});
}

// P->Q(1), Q->R(-3), R->Q(1): cycle Q->R->Q has weight -2.
inline Graph make_negative_cycle_graph() {
  return make_graph({"P", "Q", "R"}, {{"P", "Q", 1}, {"Q", "R", -3}, {"R", "Q", 1}});
}

// Invariants every Found/Unreachable result must satisfy.
inline void expect_result_invariants(const ShortestPathResult& r,
                                     const NodeId& start, const NodeId& end) {
  auto visited = visited_order(r);
  std::set<NodeId> uniq(visited.begin(), visited.end());
  EXPECT_EQ(uniq.size(), visited.size()) << "visited_order has duplicates";
  EXPECT_EQ(uniq.count(start), 0u) << "visited_order contains start";
  if (const auto* f = std::get_if<Found>(&r)) {
    ASSERT_FALSE(f->path.empty());
    EXPECT_EQ(f->path.front(), start);
    EXPECT_EQ(f->path.back(), end);
  }
  EXPECT_GE(elapsed(r).count(), 0.0);
}

inline const Found& expect_found(const ShortestPathResult& r) {
  EXPECT_TRUE(std::holds_alternative<Found>(r)) << format_summary(r);
  return std::get<Found>(r);
}

} // namespace pathviz::core::test
