#include "quill/python/convert.hpp"

#include <cstdint>
#include <string>
#include <string_view>

#include "quill/python/gil.hpp"

namespace quill::python {

namespace {

void retain_object(void * object) noexcept {
  if (!Py_IsInitialized()) {
    return;
  }
  gil_guard gil;
  Py_INCREF(static_cast<PyObject *>(object));
}

void release_object(void * object) noexcept {
  // After finalize the interpreter no longer owns anything to release into.
  if (!Py_IsInitialized()) {
    return;
  }
  gil_guard gil;
  Py_DECREF(static_cast<PyObject *>(object));
}

bool object_to_string(void * object, std::string & out, std::string & error) noexcept {
  if (!Py_IsInitialized()) {
    error = "python runtime not initialized";
    return false;
  }
  gil_guard gil;
  PyObject * text = PyObject_Str(static_cast<PyObject *>(object));
  if (text == nullptr) {
    error = fetch_error();
    return false;
  }
  const bool ok = utf8(text, out);
  Py_DECREF(text);
  if (!ok) {
    error = fetch_error();
  }
  return ok;
}

const store::foreign_ops k_object_ops = {
  &retain_object,
  &release_object,
  &object_to_string,
};

}  // namespace

const store::foreign_ops * object_ops() noexcept { return &k_object_ops; }

bool utf8(PyObject * text, std::string & out) noexcept {
  Py_ssize_t size = 0;
  const char * data = PyUnicode_AsUTF8AndSize(text, &size);
  if (data == nullptr) {
    return false;
  }
  out.assign(data, static_cast<size_t>(size));
  return true;
}

PyObject * to_python(const store::value & v) noexcept {
  switch (v.type) {
    case store::value_type::undefined:
    case store::value_type::none:
      Py_RETURN_NONE;
    case store::value_type::boolean:
      return PyBool_FromLong(v.bool_v ? 1 : 0);
    case store::value_type::integer:
      return PyLong_FromLongLong(static_cast<long long>(v.int_v));
    case store::value_type::floating:
      return PyFloat_FromDouble(v.float_v);
    case store::value_type::string:
      return PyUnicode_FromStringAndSize(v.string_v.data(),
                                         static_cast<Py_ssize_t>(v.string_v.size()));
    case store::value_type::foreign: {
      PyObject * object = static_cast<PyObject *>(v.foreign_v.get());
      if (object == nullptr) {
        Py_RETURN_NONE;
      }
      Py_INCREF(object);
      return object;
    }
  }
  PyErr_SetString(PyExc_TypeError, "unsupported context value");
  return nullptr;
}

bool from_python(PyObject * object, store::value & out) noexcept {
  if (object == Py_None) {
    out = store::make_none();
    return true;
  }
  if (PyBool_Check(object)) {
    out = store::make_bool(object == Py_True);
    return true;
  }
  if (PyLong_CheckExact(object)) {
    int overflow = 0;
    const long long parsed = PyLong_AsLongLongAndOverflow(object, &overflow);
    if (overflow == 0 && !(parsed == -1 && PyErr_Occurred() != nullptr)) {
      out = store::make_int(static_cast<int64_t>(parsed));
      return true;
    }
    PyErr_Clear();
  } else if (PyFloat_CheckExact(object)) {
    out = store::make_float(PyFloat_AS_DOUBLE(object));
    return true;
  } else if (PyUnicode_CheckExact(object)) {
    std::string text;
    if (!utf8(object, text)) {
      return false;
    }
    out = store::make_string(text);
    return true;
  }
  out = store::make_foreign(store::foreign_ref::borrow(object, object_ops()));
  return true;
}

std::string fetch_error() noexcept {
  PyObject * type = nullptr;
  PyObject * value = nullptr;
  PyObject * traceback = nullptr;
  PyErr_Fetch(&type, &value, &traceback);
  if (type == nullptr) {
    return "unknown python error";
  }
  PyErr_NormalizeException(&type, &value, &traceback);

  std::string message;
  if (PyType_Check(type)) {
    const char * name = reinterpret_cast<PyTypeObject *>(type)->tp_name;
    const std::string_view full = name != nullptr ? name : "Exception";
    const size_t dot = full.rfind('.');
    message.assign(dot == std::string_view::npos ? full : full.substr(dot + 1));
  }
  if (value != nullptr) {
    PyObject * text = PyObject_Str(value);
    std::string detail;
    if (text != nullptr && utf8(text, detail)) {
      if (!detail.empty()) {
        message += ": ";
        message += detail;
      }
    } else {
      PyErr_Clear();
    }
    Py_XDECREF(text);
  }

  // Dropping the traceback releases the frames of the failed call, including
  // any context object they still reference.
  Py_XDECREF(traceback);
  Py_XDECREF(value);
  Py_DECREF(type);
  return message;
}

}  // namespace quill::python
