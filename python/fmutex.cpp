#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "exception.hpp"
#include "held_lock.hpp"
#include "log.hpp"

#include <exception>
#include <filesystem>
#include <string>

namespace py = pybind11;

PYBIND11_MODULE(fmutex, m) {
    m.doc() = "Python bindings for fmutex - exclusive advisory file locks";

    static py::exception<fmutex::exception> error(m, "Error", PyExc_RuntimeError);
    static py::exception<fmutex::io_error> io_error(m, "IoError", PyExc_OSError);

    // IoError is raised as OSError(errno, strerror, filename) so that Python
    // code sees the errno, strerror and filename attributes
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const fmutex::io_error &e) {
            py::object filename = py::none();
            if (!e.path().empty()) filename = py::str(e.path().string());
            py::tuple args = py::make_tuple(e.code().value(), e.code().message(), filename);
            PyErr_SetObject(io_error.ptr(), args.ptr());
        } catch (const fmutex::exception &e) {
            error(e.what());
        }
    });

    py::class_<fmutex::held_lock>(m, "Guard")
        .def("unlock", &fmutex::held_lock::unlock)
        .def("__enter__", [](fmutex::held_lock &g) -> fmutex::held_lock& {
            return g;
        }, py::return_value_policy::reference_internal)
        .def("__exit__", [](fmutex::held_lock &g, py::object, py::object, py::object) {
            g.release();
            return false;
        });

    // The blocking call releases the GIL so other Python threads keep running
    m.def("lock", [](const std::string& path) {
        return fmutex::lock_held(std::filesystem::path(path));
    }, py::arg("path"), py::call_guard<py::gil_scoped_release>());

    m.def("try_lock", [](const std::string& path) {
        return fmutex::try_lock_held(std::filesystem::path(path));
    }, py::arg("path"));

    m.def("set_log_level", [](const std::string& level) {
        fmutex::set_log_level(fmutex::parse_log_level(level));
    }, py::arg("level"));
}
