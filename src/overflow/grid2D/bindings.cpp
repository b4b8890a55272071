#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>

#include "grid.hpp"

namespace py = pybind11;

PYBIND11_MODULE(grid2D_cpp, m)
{
    m.doc() = "Overflow grid simulator C++ backend";

    py::register_exception<InvalidGrid>(m, "InvalidGrid", PyExc_ValueError);
    py::register_exception<InvalidRoundCount>(m, "InvalidRoundCount", PyExc_ValueError);

    // ---------------- Traversal ----------------
    py::enum_<Traversal>(m, "Traversal")
        .value("ROW_MAJOR",    Traversal::ROW_MAJOR)
        .value("COLUMN_MAJOR", Traversal::COLUMN_MAJOR)
        .value("SHUFFLED",     Traversal::SHUFFLED)
        .value("PARALLEL",     Traversal::PARALLEL);

    // ---------------- Parameters ----------------
    py::class_<Parameters>(m, "Parameters")
        .def(py::init<>())
        .def_readwrite("threshold", &Parameters::threshold)
        .def_readwrite("rounds",    &Parameters::rounds)
        .def_readwrite("traversal", &Parameters::traversal)
        .def_readwrite("seed",      &Parameters::seed);

    // ---------------- Grid ----------------
    py::class_<Grid>(m, "Grid")
        .def(py::init<
            const std::vector<std::vector<int>>&,
            const Parameters&
        >(), py::arg("initial"), py::arg("params") = Parameters())

        .def("step", &Grid::step)
        .def("simulate", py::overload_cast<>(&Grid::simulate))
        .def("simulate", py::overload_cast<int>(&Grid::simulate), py::arg("rounds"))

        .def("shape",
             [](const Grid& g) {
                 return py::make_tuple(g.getRows(), g.getCols());
             })
        .def("rounds_run", &Grid::roundsRun)
        .def("total", &Grid::total)
        .def("is_stable", &Grid::isStable)
        .def("tolist", [](const Grid& g) { return toRows(g.cells()); })

        // ZERO-COPY NumPy view
        .def("numpy",
            [](Grid& g) {
                return py::array_t<int>(
                    {g.getRows(), g.getCols()},
                    {sizeof(int) * g.getCols(), sizeof(int)},
                    g.raw(),
                    py::cast(&g)
                );
            });

    m.def("simulate",
          py::overload_cast<const std::vector<std::vector<int>>&, int>(&simulate),
          py::arg("grid"), py::arg("rounds"),
          "Run rounds of the overflow rule and return the resulting grid");
}
