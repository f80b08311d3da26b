#pragma once

#include <stdexcept>
#include <string>

namespace pathviz::core {

// Graph construction failure: an edge names a node absent from the node set,
// or carries a non-finite weight.
struct InvalidEdge : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

// Query-time caller error: unknown start/end node or unknown algorithm name.
struct InvalidArgument : public std::invalid_argument {
  using std::invalid_argument::invalid_argument;
};

} // namespace pathviz::core
