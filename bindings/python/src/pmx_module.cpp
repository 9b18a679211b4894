// PMX Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointer (declared extern in py_types.hpp)
namespace pmx_python {
PyObject* pmx_error_type = nullptr;
} // namespace pmx_python

NB_MODULE(pmx, m) {
    m.doc() = "PMX - failure model for the market-data exploration pipeline";

    // 1. Core types (Stage, tips, formatting helpers) - no dependencies
    pmx_python::bind_core(m);

    // 2. Errors and presentation (sets pmx_error_type) - needs Stage
    pmx_python::bind_errors(m);
}
