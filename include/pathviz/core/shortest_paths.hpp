/* Single-source shortest paths (Dijkstra, Bellman-Ford) between two named nodes. */
#pragma once

#include <string_view>

#include "pathviz/core/graph.hpp"
#include "pathviz/core/result.hpp"
#include "pathviz/core/types.hpp"

namespace pathviz::core {

// Priority selection. Settles nodes in (distance, node id) order and stops
// once end is settled or nothing finite remains. Weights are assumed
// non-negative; negative weights give unspecified (but terminating) results.
// Throws InvalidArgument if start or end is not a node of g.
[[nodiscard]] ShortestPathResult
compute_dijkstra(const Graph& g, std::string_view start, std::string_view end);

// Edge relaxation over the stored edge order, at most num_nodes-1 passes with
// early exit on convergence, then one scan for a reachable negative cycle.
// Throws InvalidArgument if start or end is not a node of g.
[[nodiscard]] ShortestPathResult
compute_bellman_ford(const Graph& g, std::string_view start, std::string_view end);

// Runs the selected algorithm.
[[nodiscard]] ShortestPathResult
compute_shortest_path(const Graph& g, std::string_view start, std::string_view end,
                      Algorithm algorithm);

// "dijkstra", "bellman_ford" or "bellman-ford" (case-insensitive).
// Throws InvalidArgument otherwise.
[[nodiscard]] Algorithm parse_algorithm(std::string_view name);

// Display name: "Dijkstra" or "Bellman-Ford".
[[nodiscard]] const char* algorithm_name(Algorithm algorithm) noexcept;

} // namespace pathviz::core
