#pragma once
// Shared helpers for the PMX bindings

#include <nanobind/nanobind.h>

#include <pmx/app_error.hpp>

#include <string>

namespace nb = nanobind;

namespace pmx_python {

// Exception type pointer (set during module init)
extern PyObject* pmx_error_type;

/**
 * @brief Raise PmxError carrying the rendered message of @p error
 */
[[noreturn]] inline void raise_pmx_error(const std::string& message) {
    PyErr_SetString(pmx_error_type, message.c_str());
    throw nb::python_error();
}

[[noreturn]] inline void raise_pmx_error(const pmx::AppError& error) {
    raise_pmx_error(error.message());
}

} // namespace pmx_python
