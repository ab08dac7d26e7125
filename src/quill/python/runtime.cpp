#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "quill/python/runtime.hpp"

#include <string>
#include <utility>
#include <vector>

#include "quill/log.hpp"
#include "quill/python/context_object.hpp"
#include "quill/python/convert.hpp"
#include "quill/python/gil.hpp"
#include "quill/quill.h"

namespace quill::python {

namespace {

// A callable decorated with simple_tag, waiting for load_tags to pick it up.
struct pending_tag {
  std::string name = {};
  bool takes_context = false;
  store::foreign_ref callable = {};
};

PyThreadState * g_main_state = nullptr;
PyObject * g_module = nullptr;
bool g_inittab_added = false;
// Only touched with the GIL held.
std::vector<pending_tag> g_pending = {};

void set_message(std::string * error_out, std::string message) {
  if (error_out != nullptr) {
    *error_out = std::move(message);
  }
}

int32_t fail_runtime(std::string * error_out) {
  set_message(error_out, fetch_error());
  return QUILL_ERR_RUNTIME;
}

PyObject * register_pending(PyObject * func, PyObject * name, const bool takes_context) noexcept {
  if (!PyCallable_Check(func)) {
    PyErr_SetString(PyExc_TypeError, "simple_tag expects a callable");
    return nullptr;
  }
  pending_tag pending;
  pending.takes_context = takes_context;
  if (name != nullptr && name != Py_None) {
    if (!PyUnicode_Check(name) || !utf8(name, pending.name)) {
      if (!PyErr_Occurred()) {
        PyErr_SetString(PyExc_TypeError, "tag name must be str");
      }
      return nullptr;
    }
  } else {
    PyObject * dunder = PyObject_GetAttrString(func, "__name__");
    if (dunder == nullptr) {
      return nullptr;
    }
    const bool ok = PyUnicode_Check(dunder) && utf8(dunder, pending.name);
    Py_DECREF(dunder);
    if (!ok) {
      if (!PyErr_Occurred()) {
        PyErr_SetString(PyExc_TypeError, "tag callable has no usable __name__");
      }
      return nullptr;
    }
  }
  if (pending.name.empty()) {
    PyErr_SetString(PyExc_ValueError, "tag name must not be empty");
    return nullptr;
  }
  pending.callable = store::foreign_ref::borrow(func, object_ops());
  g_pending.push_back(std::move(pending));
  Py_INCREF(func);
  return func;
}

// Decorator returned by simple_tag(name=..., takes_context=...). `self` is
// the (name, takes_context) tuple captured at that call.
PyObject * apply_tag(PyObject * self, PyObject * func) noexcept {
  PyObject * name = PyTuple_GET_ITEM(self, 0);
  const bool takes_context = PyObject_IsTrue(PyTuple_GET_ITEM(self, 1)) == 1;
  return register_pending(func, name, takes_context);
}

PyMethodDef k_apply_tag_def = {
  "simple_tag_decorator", apply_tag, METH_O, "Registers the decorated callable as a tag.",
};

PyObject * simple_tag(PyObject *, PyObject * args, PyObject * kwargs) noexcept {
  static const char * keywords[] = {"func", "name", "takes_context", nullptr};
  PyObject * func = nullptr;
  PyObject * name = Py_None;
  int takes_context = 0;
  if (!PyArg_ParseTupleAndKeywords(args, kwargs, "|OOp:simple_tag",
                                   const_cast<char **>(keywords), &func, &name,
                                   &takes_context)) {
    return nullptr;
  }
  if (func != nullptr && func != Py_None) {
    return register_pending(func, name, takes_context != 0);
  }

  PyObject * captured = Py_BuildValue("(OO)", name, takes_context != 0 ? Py_True : Py_False);
  if (captured == nullptr) {
    return nullptr;
  }
  PyObject * decorator = PyCFunction_New(&k_apply_tag_def, captured);
  Py_DECREF(captured);
  return decorator;
}

PyMethodDef k_module_methods[] = {
  {"simple_tag", reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)()>(simple_tag)),
   METH_VARARGS | METH_KEYWORDS,
   "simple_tag(func=None, *, name=None, takes_context=False)\n"
   "Marks func as a template tag. Usable bare or with arguments."},
  {nullptr, nullptr, 0, nullptr},
};

PyModuleDef k_module_def = {
  PyModuleDef_HEAD_INIT,
  "quill",
  "Template tag registration for the quill renderer.",
  -1,
  k_module_methods,
  nullptr,
  nullptr,
  nullptr,
  nullptr,
};

PyObject * init_module() {
  PyObject * module = PyModule_Create(&k_module_def);
  if (module == nullptr) {
    return nullptr;
  }
  if (!ready_context_type(module)) {
    Py_DECREF(module);
    return nullptr;
  }
  return module;
}

bool append_search_paths(const std::vector<std::string> & paths) {
  if (paths.empty()) {
    return true;
  }
  PyObject * sys_path = PySys_GetObject("path");
  if (sys_path == nullptr || !PyList_Check(sys_path)) {
    PyErr_SetString(PyExc_RuntimeError, "sys.path is not a list");
    return false;
  }
  for (const std::string & path : paths) {
    PyObject * entry = PyUnicode_DecodeFSDefaultAndSize(path.data(),
                                                        static_cast<Py_ssize_t>(path.size()));
    if (entry == nullptr) {
      return false;
    }
    const int rc = PyList_Append(sys_path, entry);
    Py_DECREF(entry);
    if (rc != 0) {
      return false;
    }
  }
  return true;
}

PyObject * main_globals() {
  PyObject * main = PyImport_AddModule("__main__");
  return main != nullptr ? PyModule_GetDict(main) : nullptr;
}

}  // namespace

int32_t initialize(const options & opts, std::string * error_out) {
  if (g_main_state != nullptr) {
    return QUILL_OK;
  }
  if (Py_IsInitialized()) {
    set_message(error_out, "a python interpreter is already running");
    return QUILL_ERR_RUNTIME;
  }
  if (!g_inittab_added) {
    if (PyImport_AppendInittab("quill", &init_module) != 0) {
      set_message(error_out, "cannot register the quill module");
      return QUILL_ERR_RUNTIME;
    }
    g_inittab_added = true;
  }

  PyConfig config;
  if (opts.isolated) {
    PyConfig_InitIsolatedConfig(&config);
  } else {
    PyConfig_InitPythonConfig(&config);
  }
  config.install_signal_handlers = opts.install_signal_handlers ? 1 : 0;

  PyStatus status = PyConfig_SetBytesString(&config, &config.program_name,
                                            opts.program_name.c_str());
  if (!PyStatus_Exception(status)) {
    status = Py_InitializeFromConfig(&config);
  }
  PyConfig_Clear(&config);
  if (PyStatus_Exception(status)) {
    std::string message = status.err_msg != nullptr ? status.err_msg : "python startup failed";
    log::get().error("python initialize failed: {}", message);
    set_message(error_out, std::move(message));
    return QUILL_ERR_RUNTIME;
  }

  g_module = PyImport_ImportModule("quill");
  if (g_module == nullptr || !append_search_paths(opts.module_search_paths)) {
    std::string message = fetch_error();
    log::get().error("python initialize failed: {}", message);
    Py_CLEAR(g_module);
    release_context_type();
    if (Py_FinalizeEx() < 0) {
      log::get().warn("python finalize reported errors");
    }
    set_message(error_out, std::move(message));
    return QUILL_ERR_RUNTIME;
  }

  g_main_state = PyEval_SaveThread();
  log::get().info("python {} initialized", Py_GetVersion());
  return QUILL_OK;
}

void finalize() noexcept {
  if (g_main_state == nullptr) {
    return;
  }
  PyEval_RestoreThread(g_main_state);
  g_main_state = nullptr;
  g_pending.clear();
  Py_CLEAR(g_module);
  release_context_type();
  if (Py_FinalizeEx() < 0) {
    log::get().warn("python finalize reported errors");
  }
  log::get().info("python finalized");
}

bool is_initialized() noexcept { return g_main_state != nullptr && Py_IsInitialized(); }

int32_t load_tags(const std::string_view module_name, const std::string_view source,
                  tag::library & lib, std::string * error_out) {
  if (!is_initialized()) {
    set_message(error_out, "python runtime not initialized");
    return QUILL_ERR_RUNTIME;
  }
  if (module_name.empty()) {
    set_message(error_out, "module name must not be empty");
    return QUILL_ERR_INVALID_ARGUMENT;
  }

  gil_guard gil;
  const std::string name(module_name);
  const std::string code(source);
  const std::string filename = "<" + name + ">";
  g_pending.clear();

  PyObject * compiled = Py_CompileString(code.c_str(), filename.c_str(), Py_file_input);
  if (compiled == nullptr) {
    return fail_runtime(error_out);
  }
  PyObject * module = PyImport_ExecCodeModule(name.c_str(), compiled);
  Py_DECREF(compiled);
  if (module == nullptr) {
    g_pending.clear();
    return fail_runtime(error_out);
  }
  Py_DECREF(module);

  std::vector<pending_tag> found = std::move(g_pending);
  g_pending.clear();
  for (pending_tag & pending : found) {
    tag::definition def;
    def.name = std::move(pending.name);
    def.takes_context = pending.takes_context;
    def.callable = std::move(pending.callable);
    def.invoke = invoker();
    const int32_t err = tag::register_tag(lib, std::move(def));
    if (err != QUILL_OK) {
      set_message(error_out, "cannot register tag");
      return err;
    }
  }
  log::get().debug("module '{}' registered {} tag(s)", name, found.size());
  return QUILL_OK;
}

bool invoke(tag::foreign_call & call) noexcept {
  if (!is_initialized()) {
    call.error_message = "python runtime not initialized";
    call.handle.reset();
    return false;
  }
  gil_guard gil;
  auto * callable = static_cast<PyObject *>(call.callable);
  if (callable == nullptr) {
    call.error_message = "tag has no callable";
    call.handle.reset();
    return false;
  }

  const size_t arg_count = call.args != nullptr ? call.args->size() : 0;
  const Py_ssize_t offset = call.handle ? 1 : 0;
  PyObject * args = PyTuple_New(offset + static_cast<Py_ssize_t>(arg_count));
  if (args == nullptr) {
    call.handle.reset();
    call.error_message = fetch_error();
    return false;
  }
  if (call.handle) {
    PyObject * context = make_context_object(std::move(call.handle));
    call.handle.reset();
    if (context == nullptr) {
      Py_DECREF(args);
      call.error_message = fetch_error();
      return false;
    }
    PyTuple_SET_ITEM(args, 0, context);
  }
  for (size_t i = 0; i < arg_count; ++i) {
    PyObject * item = to_python((*call.args)[i]);
    if (item == nullptr) {
      Py_DECREF(args);
      call.error_message = fetch_error();
      return false;
    }
    PyTuple_SET_ITEM(args, offset + static_cast<Py_ssize_t>(i), item);
  }

  PyObject * result = PyObject_Call(callable, args, nullptr);
  Py_DECREF(args);
  if (result == nullptr) {
    call.error_message = fetch_error();
    return false;
  }
  PyObject * text = PyObject_Str(result);
  Py_DECREF(result);
  if (text == nullptr) {
    call.error_message = fetch_error();
    return false;
  }
  const bool ok = utf8(text, call.fragment);
  Py_DECREF(text);
  if (!ok) {
    call.error_message = fetch_error();
  }
  return ok;
}

int32_t run_source(const std::string_view source, std::string * error_out) {
  if (!is_initialized()) {
    set_message(error_out, "python runtime not initialized");
    return QUILL_ERR_RUNTIME;
  }
  gil_guard gil;
  PyObject * globals = main_globals();
  if (globals == nullptr) {
    return fail_runtime(error_out);
  }
  const std::string code(source);
  PyObject * result = PyRun_String(code.c_str(), Py_file_input, globals, globals);
  if (result == nullptr) {
    return fail_runtime(error_out);
  }
  Py_DECREF(result);
  return QUILL_OK;
}

int32_t eval_string(const std::string_view expression, std::string & out,
                    std::string * error_out) {
  if (!is_initialized()) {
    set_message(error_out, "python runtime not initialized");
    return QUILL_ERR_RUNTIME;
  }
  gil_guard gil;
  PyObject * globals = main_globals();
  if (globals == nullptr) {
    return fail_runtime(error_out);
  }
  const std::string code(expression);
  PyObject * result = PyRun_String(code.c_str(), Py_eval_input, globals, globals);
  if (result == nullptr) {
    return fail_runtime(error_out);
  }
  PyObject * text = PyObject_Str(result);
  Py_DECREF(result);
  if (text == nullptr) {
    return fail_runtime(error_out);
  }
  const bool ok = utf8(text, out);
  Py_DECREF(text);
  if (!ok) {
    return fail_runtime(error_out);
  }
  return QUILL_OK;
}

}  // namespace quill::python
