#include "quill/python/context_object.hpp"

#include <memory>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include "quill/python/convert.hpp"
#include "quill/python/gil.hpp"

namespace quill::python {

namespace {

struct context_object {
  PyObject_HEAD
  ::quill::handle::shared handle;
};

PyObject * g_context_type = nullptr;

context_object * as_context(PyObject * self) noexcept {
  return reinterpret_cast<context_object *>(self);
}

bool key_name(PyObject * key, std::string & out) noexcept {
  if (!PyUnicode_Check(key)) {
    PyErr_Format(PyExc_TypeError, "context keys must be str, not %.200s",
                 Py_TYPE(key)->tp_name);
    return false;
  }
  return utf8(key, out);
}

void context_dealloc(PyObject * self) noexcept {
  PyTypeObject * type = Py_TYPE(self);
  std::destroy_at(&as_context(self)->handle);
  type->tp_free(self);
  Py_DECREF(type);
}

PyObject * context_subscript(PyObject * self, PyObject * key) noexcept {
  std::string name;
  if (!key_name(key, name)) {
    return nullptr;
  }
  store::value found;
  if (!handle::get(as_context(self)->handle, name, found, release_gil{})) {
    PyErr_SetObject(PyExc_KeyError, key);
    return nullptr;
  }
  return to_python(found);
}

int context_ass_subscript(PyObject * self, PyObject * key, PyObject * value) noexcept {
  if (value == nullptr) {
    PyErr_SetString(PyExc_TypeError, "context entries cannot be deleted");
    return -1;
  }
  std::string name;
  if (!key_name(key, name)) {
    return -1;
  }
  store::value converted;
  if (!from_python(value, converted)) {
    return -1;
  }
  handle::set(as_context(self)->handle, name, std::move(converted), release_gil{});
  return 0;
}

Py_ssize_t context_length(PyObject * self) noexcept {
  const std::vector<std::string> visible = handle::names(as_context(self)->handle, release_gil{});
  return static_cast<Py_ssize_t>(visible.size());
}

int context_contains(PyObject * self, PyObject * key) noexcept {
  std::string name;
  if (!key_name(key, name)) {
    return -1;
  }
  return handle::contains(as_context(self)->handle, name, release_gil{}) ? 1 : 0;
}

PyObject * context_get(PyObject * self, PyObject * args) noexcept {
  PyObject * key = nullptr;
  PyObject * fallback = Py_None;
  if (!PyArg_ParseTuple(args, "O|O:get", &key, &fallback)) {
    return nullptr;
  }
  std::string name;
  if (!key_name(key, name)) {
    return nullptr;
  }
  store::value found;
  if (!handle::get(as_context(self)->handle, name, found, release_gil{})) {
    Py_INCREF(fallback);
    return fallback;
  }
  return to_python(found);
}

PyObject * context_set(PyObject * self, PyObject * args) noexcept {
  PyObject * key = nullptr;
  PyObject * value = nullptr;
  if (!PyArg_ParseTuple(args, "OO:set", &key, &value)) {
    return nullptr;
  }
  if (context_ass_subscript(self, key, value) != 0) {
    return nullptr;
  }
  Py_RETURN_NONE;
}

PyObject * context_keys(PyObject * self, PyObject *) noexcept {
  const std::vector<std::string> visible = handle::names(as_context(self)->handle, release_gil{});
  PyObject * out = PyList_New(static_cast<Py_ssize_t>(visible.size()));
  if (out == nullptr) {
    return nullptr;
  }
  for (size_t i = 0; i < visible.size(); ++i) {
    PyObject * item = PyUnicode_FromStringAndSize(visible[i].data(),
                                                  static_cast<Py_ssize_t>(visible[i].size()));
    if (item == nullptr) {
      Py_DECREF(out);
      return nullptr;
    }
    PyList_SET_ITEM(out, static_cast<Py_ssize_t>(i), item);
  }
  return out;
}

PyMethodDef k_context_methods[] = {
  {"get", reinterpret_cast<PyCFunction>(context_get), METH_VARARGS,
   "get(name, default=None): value bound to name, or default."},
  {"set", reinterpret_cast<PyCFunction>(context_set), METH_VARARGS,
   "set(name, value): bind name in the innermost scope."},
  {"keys", reinterpret_cast<PyCFunction>(context_keys), METH_NOARGS,
   "keys(): visible names, innermost scope first."},
  {nullptr, nullptr, 0, nullptr},
};

PyType_Slot k_context_slots[] = {
  {Py_tp_dealloc, reinterpret_cast<void *>(context_dealloc)},
  {Py_tp_doc, const_cast<char *>("Template context shared with a tag for one call.")},
  {Py_tp_methods, k_context_methods},
  {Py_mp_subscript, reinterpret_cast<void *>(context_subscript)},
  {Py_mp_ass_subscript, reinterpret_cast<void *>(context_ass_subscript)},
  {Py_mp_length, reinterpret_cast<void *>(context_length)},
  {Py_sq_contains, reinterpret_cast<void *>(context_contains)},
  {0, nullptr},
};

PyType_Spec k_context_spec = {
  "quill.Context",
  static_cast<int>(sizeof(context_object)),
  0,
  Py_TPFLAGS_DEFAULT | Py_TPFLAGS_DISALLOW_INSTANTIATION,
  k_context_slots,
};

}  // namespace

bool ready_context_type(PyObject * module) noexcept {
  if (g_context_type == nullptr) {
    g_context_type = PyType_FromSpec(&k_context_spec);
    if (g_context_type == nullptr) {
      return false;
    }
  }
  return PyModule_AddObjectRef(module, "Context", g_context_type) == 0;
}

void release_context_type() noexcept { Py_CLEAR(g_context_type); }

PyObject * make_context_object(::quill::handle::shared && h) noexcept {
  if (g_context_type == nullptr) {
    PyErr_SetString(PyExc_RuntimeError, "quill module not initialized");
    return nullptr;
  }
  auto * type = reinterpret_cast<PyTypeObject *>(g_context_type);
  PyObject * self = type->tp_alloc(type, 0);
  if (self == nullptr) {
    return nullptr;
  }
  ::new (&as_context(self)->handle) ::quill::handle::shared(std::move(h));
  return self;
}

}  // namespace quill::python
