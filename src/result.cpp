/*
  Result helpers shared by both shortest-path algorithms.

  Path reconstruction walks predecessor links back from the end node and is
  bounded by the node count, so a cyclic chain (Dijkstra fed negative weights)
  cannot loop forever.
*/
#include "pathviz/core/result.hpp"

#include <algorithm>
#include <cstddef>
#include <type_traits>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace pathviz::core {

std::vector<NodeId>
reconstruct_path(const Graph& g, std::span<const NodeIndex> pred,
                 NodeIndex start, NodeIndex end) {
  std::vector<NodeIndex> rev;
  const auto N = static_cast<std::size_t>(g.num_nodes());
  NodeIndex cur = end;
  while (cur != kNoNode) {
    if (rev.size() >= N) {
      spdlog::warn("predecessor chain from '{}' revisits a node; no path reported",
                   g.node_id(end));
      return {};
    }
    rev.push_back(cur);
    cur = pred[static_cast<std::size_t>(cur)];
  }
  if (rev.back() != start) return {};
  std::vector<NodeId> path;
  path.reserve(rev.size());
  for (auto it = rev.rbegin(); it != rev.rend(); ++it) path.push_back(g.node_id(*it));
  return path;
}

bool path_contains_edge(const ShortestPathResult& result,
                        std::string_view from, std::string_view to) noexcept {
  const auto* found = std::get_if<Found>(&result);
  if (!found) return false;
  const auto& p = found->path;
  for (std::size_t i = 0; i + 1 < p.size(); ++i) {
    if (p[i] == from && p[i + 1] == to) return true;
  }
  return false;
}

const std::string& algorithm_name(const ShortestPathResult& result) noexcept {
  return std::visit([](const auto& r) -> const std::string& { return r.algorithm_name; }, result);
}

Elapsed elapsed(const ShortestPathResult& result) noexcept {
  return std::visit([](const auto& r) { return r.elapsed; }, result);
}

std::span<const NodeId> visited_order(const ShortestPathResult& result) noexcept {
  return std::visit([](const auto& r) -> std::span<const NodeId> {
    if constexpr (std::is_same_v<std::decay_t<decltype(r)>, NegativeCycle>) {
      return {};
    } else {
      return r.visited_order;
    }
  }, result);
}

std::string format_summary(const ShortestPathResult& result) {
  std::string out = fmt::format("Algorithm: {}\n", algorithm_name(result));
  if (std::holds_alternative<NegativeCycle>(result)) {
    out += "Negative cycle detected\n";
  } else {
    const auto* found = std::get_if<Found>(&result);
    if (found) {
      out += fmt::format("Distance: {}\n", found->distance);
    } else {
      out += "Distance: ∞\n";
    }
    std::string path_str = "None";
    if (found && !found->path.empty()) {
      path_str = found->path.front();
      for (std::size_t i = 1; i < found->path.size(); ++i) {
        path_str += " → ";
        path_str += found->path[i];
      }
    }
    out += fmt::format("Path: {}\n", path_str);
  }
  out += fmt::format("Time: {:.4f} ms", elapsed(result).count());
  if (!std::holds_alternative<NegativeCycle>(result)) {
    out += fmt::format("\nVisited: {} nodes", visited_order(result).size());
  }
  return out;
}

} // namespace pathviz::core
