/*
  compute_dijkstra — priority-selection shortest path between two nodes.

  Features:
    - Deterministic settlement order: ties on distance go to the smaller
      node id (NodeIndex order equals id order).
    - Early exit as soon as the end node is settled.
    - Parallel edges are all relaxed; the cheapest one wins.
*/
#include "pathviz/core/shortest_paths.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <queue>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace pathviz::core {

ShortestPathResult
compute_dijkstra(const Graph& g, std::string_view start, std::string_view end) {
  const NodeIndex src = g.index_of(start);
  const NodeIndex dst = g.index_of(end);
  const auto t0 = std::chrono::steady_clock::now();

  const auto N = static_cast<std::size_t>(g.num_nodes());
  const auto row = g.row_offsets_view();
  const auto col = g.col_indices_view();
  const auto aei = g.adj_edge_index_view();
  const auto weight = g.weight_view();

  std::vector<Weight> dist(N, kInfDistance);
  std::vector<NodeIndex> pred(N, kNoNode);
  std::vector<std::uint8_t> settled(N, 0);
  std::vector<NodeId> visited;
  dist[static_cast<std::size_t>(src)] = 0.0;

  // Min-heap on (distance, index); stale entries are skipped on pop.
  using QItem = std::pair<Weight, NodeIndex>;
  std::priority_queue<QItem, std::vector<QItem>, std::greater<QItem>> pq;
  pq.emplace(0.0, src);

  while (!pq.empty()) {
    auto [d_u, u] = pq.top(); pq.pop();
    const auto u_idx = static_cast<std::size_t>(u);
    if (settled[u_idx] || d_u > dist[u_idx]) continue;
    settled[u_idx] = 1;
    if (u != src) visited.push_back(g.node_id(u));
    spdlog::trace("dijkstra: settled '{}' at {}", g.node_id(u), d_u);
    if (u == dst) break;

    const auto begin = static_cast<std::size_t>(row[u_idx]);
    const auto stop  = static_cast<std::size_t>(row[u_idx + 1]);
    for (std::size_t j = begin; j < stop; ++j) {
      const auto v_idx = static_cast<std::size_t>(col[j]);
      const Weight alt = dist[u_idx] + weight[static_cast<std::size_t>(aei[j])];
      if (alt < dist[v_idx]) {
        dist[v_idx] = alt;
        pred[v_idx] = u;
        // A settled node improved only through a negative weight; it is not
        // settled again.
        if (!settled[v_idx]) pq.emplace(alt, col[j]);
      }
    }
  }

  const Weight d_end = dist[static_cast<std::size_t>(dst)];
  std::vector<NodeId> path;
  if (d_end != kInfDistance) path = reconstruct_path(g, pred, src, dst);
  const Elapsed took = std::chrono::steady_clock::now() - t0;

  spdlog::debug("dijkstra {} -> {}: distance {}, {} settled, {:.4f} ms",
                start, end, d_end, visited.size(), took.count());
  if (path.empty()) {
    return Unreachable{std::move(visited), algorithm_name(Algorithm::Dijkstra), took};
  }
  return Found{d_end, std::move(path), std::move(visited),
               algorithm_name(Algorithm::Dijkstra), took};
}

} // namespace pathviz::core
