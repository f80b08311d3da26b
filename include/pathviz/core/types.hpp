/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId: node label as given by the caller (str on the Python side)
 * - NodeIndex/EdgeId: int32 positions into the graph's compact arrays
 * - Weight: float64; distances use +inf for unreachable
 * - std::string_view: borrowed string (no copy), like a read-only str
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

namespace pathviz::core {

using NodeId    = std::string;
using NodeIndex = std::int32_t;   // Dense index in ascending NodeId order
using EdgeId    = std::int32_t;   // Position in the graph's edge insertion order
using Weight    = double;         // Signed edge weight / path distance

// Wall-clock duration of one query body, in milliseconds.
using Elapsed = std::chrono::duration<double, std::milli>;

inline constexpr Weight kInfDistance = std::numeric_limits<Weight>::infinity();
inline constexpr NodeIndex kNoNode = -1;  // Unset predecessor

// Edge as supplied by the caller. Endpoints are resolved against the node set
// at graph construction.
struct EdgeSpec {
  NodeId from;
  NodeId to;
  Weight weight {0.0};
};

// Shortest-path algorithm selector.
enum class Algorithm {
  Dijkstra = 1,     // Priority selection, assumes non-negative weights
  BellmanFord = 2   // Edge relaxation, negative weights and cycle detection
};

} // namespace pathviz::core
