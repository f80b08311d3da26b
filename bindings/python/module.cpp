/*
  Pybind11 module exposing PathViz-Core C++ APIs to Python.

  Notes:
    - Graphs are built from a list of node ids and a list of
      (from, to, weight) tuples.
    - Results come back as Found / Unreachable / NegativeCycle objects;
      elapsed time is exposed in milliseconds.
    - InvalidEdge and InvalidArgument map to ValueError subclasses.
*/
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <tuple>
#include <vector>

#include "pathviz/core/demo_graph.hpp"
#include "pathviz/core/error.hpp"
#include "pathviz/core/graph.hpp"
#include "pathviz/core/logging.hpp"
#include "pathviz/core/result.hpp"
#include "pathviz/core/shortest_paths.hpp"
#include "pathviz/core/types.hpp"

namespace py = pybind11;
using namespace pathviz::core;

PYBIND11_MODULE(_pathviz_core, m) {
  m.doc() = "PathViz-Core C++ bindings";

  pathviz::core::configure_logging_from_env();

  py::register_exception<InvalidEdge>(m, "InvalidEdge", PyExc_ValueError);
  py::register_exception<InvalidArgument>(m, "InvalidArgument", PyExc_ValueError);

  py::enum_<Algorithm>(m, "Algorithm")
      .value("DIJKSTRA", Algorithm::Dijkstra)
      .value("BELLMAN_FORD", Algorithm::BellmanFord);

  py::class_<Graph>(m, "Graph")
      .def_static(
          "from_edges",
          [](const std::vector<NodeId>& nodes,
             const std::vector<std::tuple<NodeId, NodeId, double>>& edges) {
            std::vector<EdgeSpec> specs;
            specs.reserve(edges.size());
            for (const auto& [from, to, w] : edges) specs.push_back({from, to, w});
            return Graph::from_edges(nodes, specs);
          },
          py::arg("nodes"), py::arg("edges"))
      .def("num_nodes", &Graph::num_nodes)
      .def("num_edges", &Graph::num_edges)
      .def("has_node", [](const Graph& g, const std::string& id){ return g.has_node(id); }, py::arg("id"))
      .def("node_ids", [](const Graph& g){
        auto s = g.node_ids();
        return std::vector<NodeId>(s.begin(), s.end());
      })
      .def("out_edges", [](const Graph& g, const std::string& id){ return g.out_edges(id); }, py::arg("id"))
      // Edge sequence in insertion order, as (from, to, weight) tuples.
      .def("edges", [](const Graph& g){
        auto src = g.edge_src_view();
        auto dst = g.edge_dst_view();
        auto w = g.weight_view();
        py::list out;
        for (std::size_t e = 0; e < w.size(); ++e) {
          out.append(py::make_tuple(g.node_id(src[e]), g.node_id(dst[e]), w[e]));
        }
        return out;
      });

  py::class_<Found>(m, "Found")
      .def_readonly("distance", &Found::distance)
      .def_readonly("path", &Found::path)
      .def_readonly("visited_order", &Found::visited_order)
      .def_readonly("algorithm", &Found::algorithm_name)
      .def_property_readonly("execution_time_ms", [](const Found& r){ return r.elapsed.count(); })
      .def("__repr__", [](const Found& r){ return "<Found distance=" + py::repr(py::float_(r.distance)).cast<std::string>() + ">"; });

  py::class_<Unreachable>(m, "Unreachable")
      .def_property_readonly("distance", [](const Unreachable&){ return kInfDistance; })
      .def_property_readonly("path", [](const Unreachable&){ return std::vector<NodeId>{}; })
      .def_readonly("visited_order", &Unreachable::visited_order)
      .def_readonly("algorithm", &Unreachable::algorithm_name)
      .def_property_readonly("execution_time_ms", [](const Unreachable& r){ return r.elapsed.count(); })
      .def("__repr__", [](const Unreachable&){ return std::string("<Unreachable>"); });

  py::class_<NegativeCycle>(m, "NegativeCycle")
      .def_readonly("algorithm", &NegativeCycle::algorithm_name)
      .def_property_readonly("execution_time_ms", [](const NegativeCycle& r){ return r.elapsed.count(); })
      .def_property_readonly("error", [](const NegativeCycle&){ return std::string("Negative cycle detected"); })
      .def("__repr__", [](const NegativeCycle&){ return std::string("<NegativeCycle>"); });

  m.def("compute_dijkstra",
        [](const Graph& g, const std::string& start, const std::string& end) {
          py::gil_scoped_release release;
          return compute_dijkstra(g, start, end);
        }, py::arg("g"), py::arg("start"), py::arg("end"));

  m.def("compute_bellman_ford",
        [](const Graph& g, const std::string& start, const std::string& end) {
          py::gil_scoped_release release;
          return compute_bellman_ford(g, start, end);
        }, py::arg("g"), py::arg("start"), py::arg("end"));

  // algorithm accepts an Algorithm value or its name ("dijkstra", "bellman_ford").
  m.def("compute_shortest_path",
        [](const Graph& g, const std::string& start, const std::string& end, py::object algorithm) {
          Algorithm alg = py::isinstance<py::str>(algorithm)
              ? parse_algorithm(algorithm.cast<std::string>())
              : algorithm.cast<Algorithm>();
          py::gil_scoped_release release;
          return compute_shortest_path(g, start, end, alg);
        }, py::arg("g"), py::arg("start"), py::arg("end"), py::kw_only(),
        py::arg("algorithm") = py::str("dijkstra"));

  m.def("path_contains_edge",
        [](const ShortestPathResult& result, const std::string& from, const std::string& to) {
          return path_contains_edge(result, from, to);
        }, py::arg("result"), py::arg("from_id"), py::arg("to_id"));

  m.def("format_summary", &format_summary, py::arg("result"));

  m.def("demo_graph", &make_demo_graph);

  m.def("set_log_level",
        [](const std::string& level) { set_log_level(level); },
        py::arg("level"));
}
