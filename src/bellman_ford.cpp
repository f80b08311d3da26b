/*
  compute_bellman_ford — edge-relaxation shortest path with negative-cycle check.

  Passes visit edges in insertion order. visited_order records each node on
  its first improvement only. A reachable negative cycle short-circuits path
  reconstruction.
*/
#include "pathviz/core/shortest_paths.hpp"

#include <chrono>
#include <cstdint>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace pathviz::core {

ShortestPathResult
compute_bellman_ford(const Graph& g, std::string_view start, std::string_view end) {
  const NodeIndex src = g.index_of(start);
  const NodeIndex dst = g.index_of(end);
  const auto t0 = std::chrono::steady_clock::now();

  const auto N = static_cast<std::size_t>(g.num_nodes());
  const auto M = static_cast<std::size_t>(g.num_edges());
  const auto esrc = g.edge_src_view();
  const auto edst = g.edge_dst_view();
  const auto weight = g.weight_view();

  std::vector<Weight> dist(N, kInfDistance);
  std::vector<NodeIndex> pred(N, kNoNode);
  std::vector<std::uint8_t> seen(N, 0);
  std::vector<NodeId> visited;
  dist[static_cast<std::size_t>(src)] = 0.0;

  std::size_t passes = 0;
  for (std::size_t pass = 0; pass + 1 < N; ++pass) {
    bool updated = false;
    for (std::size_t e = 0; e < M; ++e) {
      const auto u = static_cast<std::size_t>(esrc[e]);
      const auto v = static_cast<std::size_t>(edst[e]);
      if (dist[u] == kInfDistance) continue;
      const Weight alt = dist[u] + weight[e];
      if (alt < dist[v]) {
        dist[v] = alt;
        pred[v] = esrc[e];
        updated = true;
        if (!seen[v] && edst[e] != src) {
          seen[v] = 1;
          visited.push_back(g.node_id(edst[e]));
        }
        spdlog::trace("bellman-ford: pass {} relaxed '{}' to {}", pass, g.node_id(edst[e]), alt);
      }
    }
    ++passes;
    if (!updated) break;
  }

  for (std::size_t e = 0; e < M; ++e) {
    const auto u = static_cast<std::size_t>(esrc[e]);
    const auto v = static_cast<std::size_t>(edst[e]);
    if (dist[u] != kInfDistance && dist[u] + weight[e] < dist[v]) {
      const Elapsed took = std::chrono::steady_clock::now() - t0;
      spdlog::debug("bellman-ford {} -> {}: negative cycle through '{}' -> '{}' after {} passes",
                    start, end, g.node_id(esrc[e]), g.node_id(edst[e]), passes);
      return NegativeCycle{algorithm_name(Algorithm::BellmanFord), took};
    }
  }

  const Weight d_end = dist[static_cast<std::size_t>(dst)];
  std::vector<NodeId> path;
  if (d_end != kInfDistance) path = reconstruct_path(g, pred, src, dst);
  const Elapsed took = std::chrono::steady_clock::now() - t0;

  spdlog::debug("bellman-ford {} -> {}: distance {}, {} improved, {} passes, {:.4f} ms",
                start, end, d_end, visited.size(), passes, took.count());
  if (path.empty()) {
    return Unreachable{std::move(visited), algorithm_name(Algorithm::BellmanFord), took};
  }
  return Found{d_end, std::move(path), std::move(visited),
               algorithm_name(Algorithm::BellmanFord), took};
}

} // namespace pathviz::core
