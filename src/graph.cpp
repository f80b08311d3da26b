/*
  Graph — immutable weighted digraph with deterministic layout.

  Construction sorts and deduplicates node ids, resolves edge endpoints to
  dense indices (rejecting unknown ids and non-finite weights) and builds a
  CSR adjacency that keeps edge insertion order within each source node.
*/
#include "pathviz/core/graph.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include <spdlog/spdlog.h>

#include "pathviz/core/error.hpp"

namespace pathviz::core {

Graph Graph::from_edges(std::span<const NodeId> nodes,
                        std::span<const EdgeSpec> edges) {
  Graph g;
  g.ids_.assign(nodes.begin(), nodes.end());
  std::sort(g.ids_.begin(), g.ids_.end());
  g.ids_.erase(std::unique(g.ids_.begin(), g.ids_.end()), g.ids_.end());

  const std::size_t m = edges.size();
  g.src_.reserve(m);
  g.dst_.reserve(m);
  g.weight_.reserve(m);
  for (std::size_t i = 0; i < m; ++i) {
    const auto& e = edges[i];
    auto u = g.find_node(e.from);
    auto v = g.find_node(e.to);
    if (!u) {
      throw InvalidEdge("edge " + std::to_string(i) + " (" + e.from + " -> " + e.to +
                        "): unknown source node '" + e.from + "'");
    }
    if (!v) {
      throw InvalidEdge("edge " + std::to_string(i) + " (" + e.from + " -> " + e.to +
                        "): unknown target node '" + e.to + "'");
    }
    if (!std::isfinite(e.weight)) {
      throw InvalidEdge("edge " + std::to_string(i) + " (" + e.from + " -> " + e.to +
                        "): weight must be finite");
    }
    g.src_.push_back(*u);
    g.dst_.push_back(*v);
    g.weight_.push_back(e.weight);
  }

  // Build CSR adjacency; the cursor fill is stable so per-node entries stay
  // in insertion order.
  const auto n = g.ids_.size();
  g.row_offsets_.assign(n + 1, 0);
  for (std::size_t i = 0; i < m; ++i) {
    g.row_offsets_[static_cast<std::size_t>(g.src_[i]) + 1]++;
  }
  for (std::size_t i = 1; i < g.row_offsets_.size(); ++i) {
    g.row_offsets_[i] += g.row_offsets_[i - 1];
  }
  g.col_indices_.resize(m);
  g.adj_edge_index_.resize(m);
  std::vector<std::int32_t> cursor = g.row_offsets_;
  for (std::size_t e = 0; e < m; ++e) {
    auto u = g.src_[e];
    auto pos = static_cast<std::size_t>(cursor[static_cast<std::size_t>(u)]++);
    g.col_indices_[pos] = g.dst_[e];
    g.adj_edge_index_[pos] = static_cast<EdgeId>(e);
  }
  spdlog::debug("graph built: {} nodes, {} edges", g.num_nodes(), g.num_edges());
  return g;
}

std::optional<NodeIndex> Graph::find_node(std::string_view id) const noexcept {
  auto it = std::lower_bound(ids_.begin(), ids_.end(), id,
                             [](const NodeId& a, std::string_view b) { return a < b; });
  if (it == ids_.end() || *it != id) return std::nullopt;
  return static_cast<NodeIndex>(it - ids_.begin());
}

NodeIndex Graph::index_of(std::string_view id) const {
  auto v = find_node(id);
  if (!v) {
    throw InvalidArgument("unknown node '" + std::string(id) + "'");
  }
  return *v;
}

std::vector<std::pair<NodeId, Weight>> Graph::out_edges(std::string_view id) const {
  const auto u = static_cast<std::size_t>(index_of(id));
  const auto begin = static_cast<std::size_t>(row_offsets_[u]);
  const auto end = static_cast<std::size_t>(row_offsets_[u + 1]);
  std::vector<std::pair<NodeId, Weight>> out;
  out.reserve(end - begin);
  for (std::size_t j = begin; j < end; ++j) {
    auto v = static_cast<std::size_t>(col_indices_[j]);
    out.emplace_back(ids_[v], weight_[static_cast<std::size_t>(adj_edge_index_[j])]);
  }
  return out;
}

} // namespace pathviz::core
