// src/pybind/python_module.cpp
#include "connectfour/python/bindings.h"

PYBIND11_MODULE(_connectfour_cpp, m) {
    m.doc() = "Connect Four game engine C++ bindings";
    connectfour::python::registerBindings(m);
}
