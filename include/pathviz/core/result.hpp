/* Shortest-path result records, path reconstruction and path queries. */
#pragma once

#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "pathviz/core/graph.hpp"
#include "pathviz/core/types.hpp"

namespace pathviz::core {

// End node reached with a finite distance. path runs start..end inclusive;
// visited_order never holds the start node and has no duplicates.
struct Found {
  Weight distance {0.0};
  std::vector<NodeId> path;
  std::vector<NodeId> visited_order;
  std::string algorithm_name;
  Elapsed elapsed {};
};

// End node has no finite-distance path from start.
struct Unreachable {
  std::vector<NodeId> visited_order;
  std::string algorithm_name;
  Elapsed elapsed {};
};

// A negative-weight cycle is reachable from start (relaxation algorithm only).
struct NegativeCycle {
  std::string algorithm_name;
  Elapsed elapsed {};
};

using ShortestPathResult = std::variant<Found, Unreachable, NegativeCycle>;

// Rebuild start..end from predecessor links (kNoNode = unset), indexed by
// NodeIndex. Returns an empty path when the chain does not end at start or
// revisits a node.
[[nodiscard]] std::vector<NodeId>
reconstruct_path(const Graph& g, std::span<const NodeIndex> pred,
                 NodeIndex start, NodeIndex end);

// True iff (from, to) are adjacent, in that order, on a Found result's path.
[[nodiscard]] bool path_contains_edge(const ShortestPathResult& result,
                                      std::string_view from, std::string_view to) noexcept;

// Accessors valid for every variant. visited_order is empty for NegativeCycle.
[[nodiscard]] const std::string& algorithm_name(const ShortestPathResult& result) noexcept;
[[nodiscard]] Elapsed elapsed(const ShortestPathResult& result) noexcept;
[[nodiscard]] std::span<const NodeId> visited_order(const ShortestPathResult& result) noexcept;

// Multi-line report as shown in the visualizer's results panel.
[[nodiscard]] std::string format_summary(const ShortestPathResult& result);

} // namespace pathviz::core
