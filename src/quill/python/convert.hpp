#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <string>

#include "quill/store/value.hpp"

namespace quill::python {

// foreign_ops for PyObject*: incref, decref and str(), each taking the GIL.
const store::foreign_ops * object_ops() noexcept;

// New reference, or nullptr with a Python exception set.
PyObject * to_python(const store::value & v) noexcept;

// Exact None/bool/int/float/str become native values; everything else,
// including subclasses of those, is kept as a foreign reference. Returns
// false with a Python exception set when a str cannot be encoded.
bool from_python(PyObject * object, store::value & out) noexcept;

bool utf8(PyObject * text, std::string & out) noexcept;

// Fetches and clears the pending exception as "TypeName: message".
std::string fetch_error() noexcept;

}  // namespace quill::python
