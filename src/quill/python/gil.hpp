#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <utility>

namespace quill::python {

// Holds the GIL for the current scope. Safe to nest.
class gil_guard {
 public:
  gil_guard() noexcept : state_(PyGILState_Ensure()) {}
  ~gil_guard() { PyGILState_Release(state_); }

  gil_guard(const gil_guard &) = delete;
  gil_guard & operator=(const gil_guard &) = delete;

 private:
  PyGILState_STATE state_;
};

// Unblock hook for handle::lock: a contended wait runs with the GIL released
// so the thread holding the cell can reacquire it and finish.
struct release_gil {
  template <class Wait>
  void operator()(Wait && wait) const {
    Py_BEGIN_ALLOW_THREADS
    std::forward<Wait>(wait)();
    Py_END_ALLOW_THREADS
  }
};

}  // namespace quill::python
