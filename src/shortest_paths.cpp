/*
  Algorithm dispatch and naming for the shortest-path entry points.
*/
#include "pathviz/core/shortest_paths.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "pathviz/core/error.hpp"

namespace pathviz::core {

ShortestPathResult
compute_shortest_path(const Graph& g, std::string_view start, std::string_view end,
                      Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::Dijkstra:
      return compute_dijkstra(g, start, end);
    case Algorithm::BellmanFord:
      return compute_bellman_ford(g, start, end);
  }
  throw InvalidArgument("unknown algorithm selector " +
                        std::to_string(static_cast<int>(algorithm)));
}

Algorithm parse_algorithm(std::string_view name) {
  std::string key(name);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (key == "dijkstra") return Algorithm::Dijkstra;
  if (key == "bellman_ford" || key == "bellman-ford") return Algorithm::BellmanFord;
  throw InvalidArgument("unknown algorithm '" + std::string(name) +
                        "' (expected 'dijkstra' or 'bellman_ford')");
}

const char* algorithm_name(Algorithm algorithm) noexcept {
  switch (algorithm) {
    case Algorithm::Dijkstra: return "Dijkstra";
    case Algorithm::BellmanFord: return "Bellman-Ford";
  }
  return "unknown";
}

} // namespace pathviz::core
