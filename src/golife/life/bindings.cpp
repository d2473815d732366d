#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "life.hpp"
#include "pattern.hpp"
#include "universe.hpp"

namespace py = pybind11;

PYBIND11_MODULE(golife_cpp, m)
{
    m.doc() = "Conway's Game of Life C++ backend";

    // ---------------- Errors ----------------
    py::register_exception<InvalidDimensions>(m, "InvalidDimensions", PyExc_ValueError);
    py::register_exception<OutOfBounds>(m, "OutOfBounds", PyExc_IndexError);

    // ---------------- Enums ----------------
    py::enum_<EdgePolicy>(m, "EdgePolicy")
        .value("TORUS", EDGE_TORUS)
        .value("DEAD",  EDGE_DEAD);

    py::enum_<Control>(m, "Control")
        .value("PAUSE",          CONTROL_PAUSE)
        .value("SPEED_DECREASE", CONTROL_SPEED_DECREASE)
        .value("SPEED_INCREASE", CONTROL_SPEED_INCREASE)
        .value("REPLAY",         CONTROL_REPLAY);

    // ---------------- Parameters ----------------
    py::class_<LifeParameters>(m, "LifeParameters")
        .def(py::init<>())
        .def_readwrite("edge", &LifeParameters::edge)
        .def_readwrite("fill", &LifeParameters::fill);

    // ---------------- Life ----------------
    py::class_<Life>(m, "Life")
        .def(py::init<int, int, const LifeParameters&>(),
             py::arg("cols"), py::arg("rows"),
             py::arg("params") = LifeParameters())
        .def(py::init<int, int, uint32_t, const LifeParameters&>(),
             py::arg("cols"), py::arg("rows"), py::arg("seed"),
             py::arg("params") = LifeParameters())
        .def(py::init<const Pattern&, const LifeParameters&>(),
             py::arg("pattern"), py::arg("params") = LifeParameters())
        .def(py::init<const std::vector<std::vector<int>>&, const LifeParameters&>(),
             py::arg("pattern"), py::arg("params") = LifeParameters())

        .def("step", static_cast<void (Life::*)()>(&Life::step))
        .def("step", static_cast<void (Life::*)(int)>(&Life::step), py::arg("n"))
        .def("alive", &Life::alive, py::arg("x"), py::arg("y"))
        .def("cols", &Life::cols)
        .def("rows", &Life::rows)
        .def("generation", &Life::generation)
        .def("population", &Life::population)
        .def_property_readonly("edge", &Life::edge)
        .def("snapshot", &Life::snapshot)
        .def("__str__", &Life::toString)

        .def("shape",
             [](const Life& l) {
                 return py::make_tuple(l.rows(), l.cols());
             })

        // ZERO-COPY NumPy view of the current generation; after a step it
        // shows the buffer the next step will overwrite
        .def("numpy",
            [](Life& l) {
                return py::array_t<uint8_t>(
                    {static_cast<py::ssize_t>(l.rows()), static_cast<py::ssize_t>(l.cols())},
                    {static_cast<py::ssize_t>(sizeof(uint8_t) * l.cols()),
                     static_cast<py::ssize_t>(sizeof(uint8_t))},
                    l.raw().data(),
                    py::cast(&l)
                );
            });

    // ---------------- Universe ----------------
    py::class_<Universe>(m, "Universe")
        .def(py::init<const Life&, uint32_t>(),
             py::arg("life"), py::arg("render_every") = INITIAL_RENDER_EVERY)
        .def("tick", &Universe::tick)
        .def("apply", &Universe::apply, py::arg("control"))
        .def("replay", &Universe::replay)
        .def("life", &Universe::life, py::return_value_policy::reference_internal)
        .def("seed", &Universe::seed)
        .def_property_readonly("render_every", &Universe::renderEvery)
        .def_property_readonly("paused", &Universe::paused);

    // ---------------- Pattern I/O ----------------
    m.def("parse_pattern", &parsePattern, py::arg("text"));
    m.def("load_pattern", &loadPattern, py::arg("filename"));
    m.def("save_pattern", &savePattern, py::arg("life"), py::arg("filename"));
}
