#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>

#include "census.hpp"

namespace py = pybind11;

PYBIND11_MODULE(census_cpp, m)
{
    m.doc() = "Game of Life census C++ backend";

    py::enum_<EdgePolicy>(m, "EdgePolicy", py::module_local())
        .value("TORUS", EDGE_TORUS)
        .value("DEAD",  EDGE_DEAD);

    m.def("population", &population, py::arg("grid"));
    m.def("density", &density, py::arg("grid"));
    m.def("neighbor_counts", &neighborCounts,
          py::arg("grid"), py::arg("edge") = EDGE_TORUS);
    m.def("block_density", &blockDensity,
          py::arg("grid"), py::arg("block"));
}
