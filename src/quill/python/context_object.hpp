#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "quill/handle/shared_context.hpp"

namespace quill::python {

// Creates `quill.Context` and adds it to `module`. Returns false with a
// Python exception set.
bool ready_context_type(PyObject * module) noexcept;

// Drops the type reference held for make_context_object. GIL required.
void release_context_type() noexcept;

/**
 * Wraps one handle duplicate in a new `quill.Context`.
 *
 * The object owns `h` for its whole lifetime; Python code that stores the
 * object keeps the handle alive past the call that received it. Returns a
 * new reference, or nullptr with a Python exception set. GIL required.
 */
PyObject * make_context_object(::quill::handle::shared && h) noexcept;

}  // namespace quill::python
