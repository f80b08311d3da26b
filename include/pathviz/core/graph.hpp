/* Immutable weighted directed multigraph keyed by string node ids. */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "pathviz/core/types.hpp"

namespace pathviz::core {

// Notes on identifiers:
// - Node ids are sorted ascending at construction; NodeIndex i refers to
//   node_ids()[i]. Index order therefore equals lexicographic id order.
// - EdgeId is the edge's position in the caller's edge sequence. Edges are
//   never reordered: relaxation passes and per-node adjacency both follow
//   insertion order.

class Graph {
public:
  [[nodiscard]] static Graph from_edges(std::span<const NodeId> nodes,
                                        std::span<const EdgeSpec> edges);
  ~Graph() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(ids_.size()); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(weight_.size()); }

  [[nodiscard]] std::span<const NodeId> node_ids() const noexcept { return ids_; }
  [[nodiscard]] const NodeId& node_id(NodeIndex v) const { return ids_.at(static_cast<std::size_t>(v)); }
  [[nodiscard]] bool has_node(std::string_view id) const noexcept { return find_node(id).has_value(); }
  [[nodiscard]] std::optional<NodeIndex> find_node(std::string_view id) const noexcept;
  // Throws InvalidArgument for an unknown id.
  [[nodiscard]] NodeIndex index_of(std::string_view id) const;

  // Outgoing (neighbor id, weight) pairs of a node in edge insertion order.
  // Throws InvalidArgument for an unknown id.
  [[nodiscard]] std::vector<std::pair<NodeId, Weight>> out_edges(std::string_view id) const;

  // Edge sequence in insertion order.
  [[nodiscard]] std::span<const NodeIndex> edge_src_view() const noexcept { return src_; }
  [[nodiscard]] std::span<const NodeIndex> edge_dst_view() const noexcept { return dst_; }
  [[nodiscard]] std::span<const Weight> weight_view() const noexcept { return weight_; }
  // CSR adjacency: outgoing entries of node u live in [row[u], row[u+1]).
  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const NodeIndex> col_indices_view() const noexcept { return col_indices_; }
  [[nodiscard]] std::span<const EdgeId> adj_edge_index_view() const noexcept { return adj_edge_index_; }

private:
  std::vector<NodeId> ids_ {};
  std::vector<NodeIndex> src_ {};
  std::vector<NodeIndex> dst_ {};
  std::vector<Weight> weight_ {};

  std::vector<std::int32_t> row_offsets_ {};
  std::vector<NodeIndex> col_indices_ {};
  std::vector<EdgeId> adj_edge_index_ {}; // map CSR entry -> EdgeId
};

} // namespace pathviz::core
