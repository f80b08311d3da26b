/* Default graph loaded by the visualizer on start-up. */
#pragma once

#include "pathviz/core/graph.hpp"

namespace pathviz::core {

// Nodes A..E with edges A->B(4), A->E(2), B->C(3), B->D(1), C->D(2),
// D->E(3), E->B(7), in that order.
[[nodiscard]] Graph make_demo_graph();

inline constexpr const char* kDemoStart = "A";
inline constexpr const char* kDemoEnd = "C";

} // namespace pathviz::core
