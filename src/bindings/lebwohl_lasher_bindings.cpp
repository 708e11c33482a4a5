#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "../include/lebwohl_lasher_model.hpp"

namespace py = pybind11;

PYBIND11_MODULE(lebwohl_lasher, m) {
    py::class_<LebwohlLasherModel>(m, "LebwohlLasherModel")
        .def(py::init<int, double>())
        .def(py::init<int, double, unsigned int>())
        .def("metropolis_sweep", &LebwohlLasherModel::metropolis_sweep)
        .def("compute_energy", &LebwohlLasherModel::compute_energy)
        .def("site_energy", &LebwohlLasherModel::site_energy)
        .def("get_lattice", &LebwohlLasherModel::get_lattice)
        .def("set_lattice", &LebwohlLasherModel::set_lattice)
        .def("set_seed", &LebwohlLasherModel::set_seed)
        .def("set_T", &LebwohlLasherModel::set_T)
        .def("get_T", &LebwohlLasherModel::get_T)
        .def("size", &LebwohlLasherModel::size);

    m.def("site_energy", [](const Lattice& lattice, int x, int y, int N) {
        check_lattice_shape(lattice, N);
        check_site_index(x, y, N);
        return site_energy(lattice, x, y, N);
    });
    m.def("lattice_energy", [](const Lattice& lattice, int N) {
        check_lattice_shape(lattice, N);
        return lattice_energy(lattice, N);
    });
}
