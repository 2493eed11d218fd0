// bindings.h
#ifndef CONNECTFOUR_PYTHON_BINDINGS_H
#define CONNECTFOUR_PYTHON_BINDINGS_H

#include <pybind11/pybind11.h>

namespace connectfour {
namespace python {

/**
 * @brief Register the engine's classes, enums and exceptions on a module
 *
 * Shared by the _connectfour_cpp extension module and embedded interpreters.
 */
void registerBindings(pybind11::module& m);

} // namespace python
} // namespace connectfour

#endif // CONNECTFOUR_PYTHON_BINDINGS_H
