// PyBind11 bindings for the DCONF core.
// Exposes DynamicGraph, the time-respecting path oracle, and the
// delta-conformity entry points to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DDCONF_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "graph/graph.hpp"
#include "graph/dynamic_graph.hpp"
#include "paths/path_oracle.hpp"
#include "paths/time_respecting_paths.hpp"
#include "conformity/conformity_types.hpp"
#include "conformity/delta_conformity.hpp"
#include "conformity/sliding_conformity.hpp"
#include "common/errors.hpp"

namespace py = pybind11;

PYBIND11_MODULE(dconf_bindings, m) {
    m.doc() = "DCONF delta-conformity C++ core bindings";

    // ── Node ──
    py::class_<dconf::Node>(m, "Node")
        .def(py::init<>())
        .def(py::init<dconf::NodeId>())
        .def_readwrite("id", &dconf::Node::id)
        .def_readwrite("labels", &dconf::Node::labels)
        .def("set_label", &dconf::Node::setLabel)
        .def("get_label", &dconf::Node::getLabel,
             py::arg("name"), py::arg("default_val") = "")
        .def("has_label", &dconf::Node::hasLabel);

    // ── Edge ──
    py::class_<dconf::Edge>(m, "Edge")
        .def(py::init<>())
        .def_readonly("id", &dconf::Edge::id)
        .def_readonly("source", &dconf::Edge::source)
        .def_readonly("target", &dconf::Edge::target)
        .def_readonly("t_from", &dconf::Edge::t_from)
        .def_readonly("t_to", &dconf::Edge::t_to)
        .def("active_at", &dconf::Edge::activeAt);

    // ── Graph (snapshot) ──
    py::class_<dconf::Graph>(m, "Graph")
        .def(py::init<>())
        .def("has_node", &dconf::Graph::hasNode)
        .def("get_node", py::overload_cast<dconf::NodeId>(&dconf::Graph::getNode),
             py::return_value_policy::reference_internal)
        .def("get_node_ids", &dconf::Graph::getNodeIds)
        .def("node_count", &dconf::Graph::nodeCount)
        .def("edge_count", &dconf::Graph::edgeCount)
        .def("get_neighbor_nodes", &dconf::Graph::getNeighborNodes)
        .def("degree", &dconf::Graph::degree);

    // ── DynamicGraph ──
    py::class_<dconf::DynamicGraph>(m, "DynamicGraph")
        .def(py::init<>())
        .def("add_node", &dconf::DynamicGraph::addNode,
             py::arg("id"), py::arg("labels") = std::unordered_map<std::string, std::string>{})
        .def("has_node", &dconf::DynamicGraph::hasNode)
        .def("node_count", &dconf::DynamicGraph::nodeCount)
        .def("add_interaction",
             py::overload_cast<dconf::NodeId, dconf::NodeId, int64_t>(
                 &dconf::DynamicGraph::addInteraction),
             py::arg("u"), py::arg("v"), py::arg("t"))
        .def("add_interaction",
             py::overload_cast<dconf::NodeId, dconf::NodeId, int64_t, int64_t>(
                 &dconf::DynamicGraph::addInteraction),
             py::arg("u"), py::arg("v"), py::arg("t_from"), py::arg("t_to"))
        .def("interaction_count", &dconf::DynamicGraph::interactionCount)
        .def("time_slice", &dconf::DynamicGraph::timeSlice,
             py::arg("t_from"), py::arg("t_to"))
        .def("temporal_snapshot_ids", &dconf::DynamicGraph::temporalSnapshotIds);

    // ── PathPolicy ──
    py::enum_<dconf::PathPolicy>(m, "PathPolicy")
        .value("SHORTEST", dconf::PathPolicy::SHORTEST)
        .value("FASTEST", dconf::PathPolicy::FASTEST)
        .value("FOREMOST", dconf::PathPolicy::FOREMOST)
        .value("FASTEST_SHORTEST", dconf::PathPolicy::FASTEST_SHORTEST)
        .value("SHORTEST_FASTEST", dconf::PathPolicy::SHORTEST_FASTEST);

    // ── PolicyDistances ──
    py::class_<dconf::PolicyDistances>(m, "PolicyDistances")
        .def(py::init<>())
        .def_readwrite("shortest", &dconf::PolicyDistances::shortest)
        .def_readwrite("fastest", &dconf::PolicyDistances::fastest)
        .def_readwrite("foremost", &dconf::PolicyDistances::foremost)
        .def_readwrite("fastest_shortest", &dconf::PolicyDistances::fastest_shortest)
        .def_readwrite("shortest_fastest", &dconf::PolicyDistances::shortest_fastest);

    // ── TemporalPathOracle ──
    py::class_<dconf::TemporalPathOracle>(m, "TemporalPathOracle")
        .def(py::init<>())
        .def("distances", &dconf::TemporalPathOracle::distances,
             py::arg("snapshot"), py::arg("t_from"), py::arg("t_to"))
        .def("distances_from", &dconf::TemporalPathOracle::distancesFrom,
             py::arg("snapshot"), py::arg("source"), py::arg("t_from"), py::arg("t_to"));

    // ── TrendPoint ──
    py::class_<dconf::TrendPoint>(m, "TrendPoint")
        .def(py::init<>())
        .def_readwrite("timestamp", &dconf::TrendPoint::timestamp)
        .def_readwrite("score", &dconf::TrendPoint::score)
        .def("__repr__", [](const dconf::TrendPoint& p) {
            return "(" + std::to_string(p.timestamp) + ", " + std::to_string(p.score) + ")";
        });

    m.def("delta_conformity",
          [](const dconf::DynamicGraph& graph, int64_t start, int64_t delta,
             const std::vector<double>& alphas, const std::vector<std::string>& labels,
             size_t profile_size, const dconf::Hierarchies& hierarchies,
             const std::string& path_type) {
              dconf::TemporalPathOracle oracle;
              return dconf::deltaConformity(graph, oracle, start, delta, alphas, labels,
                                            profile_size, hierarchies,
                                            dconf::pathPolicyFromString(path_type));
          },
          py::arg("graph"), py::arg("start"), py::arg("delta"),
          py::arg("alphas"), py::arg("labels"), py::arg("profile_size") = 1,
          py::arg("hierarchies") = dconf::Hierarchies{},
          py::arg("path_type") = "shortest");

    m.def("sliding_delta_conformity",
          [](const dconf::DynamicGraph& graph, int64_t delta,
             const std::vector<double>& alphas, const std::vector<std::string>& labels,
             size_t profile_size, const dconf::Hierarchies& hierarchies,
             const std::string& path_type) {
              dconf::TemporalPathOracle oracle;
              return dconf::slidingDeltaConformity(graph, graph, oracle, delta, alphas, labels,
                                                   profile_size, hierarchies,
                                                   dconf::pathPolicyFromString(path_type)).series;
          },
          py::arg("graph"), py::arg("delta"),
          py::arg("alphas"), py::arg("labels"), py::arg("profile_size") = 1,
          py::arg("hierarchies") = dconf::Hierarchies{},
          py::arg("path_type") = "shortest");

    // Library errors surface as ValueError / RuntimeError subclasses.
    py::register_exception<dconf::InvalidArgument>(m, "InvalidArgument", PyExc_ValueError);
    py::register_exception<dconf::PreconditionViolation>(m, "PreconditionViolation",
                                                        PyExc_RuntimeError);
    py::register_exception<dconf::UpstreamDataError>(m, "UpstreamDataError", PyExc_RuntimeError);
}
