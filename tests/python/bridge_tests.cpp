#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <doctest/doctest.h>

#include "quill/python/convert.hpp"
#include "quill/python/gil.hpp"
#include "quill/python/runtime.hpp"
#include "quill/quill.h"
#include "quill/tag/sm.hpp"

namespace {

std::string eval(std::string_view expression) {
  std::string out;
  std::string error;
  const int32_t err = quill::python::eval_string(expression, out, &error);
  CHECK_MESSAGE(err == QUILL_OK, error);
  return out;
}

struct call_result {
  int32_t err = QUILL_OK;
  std::string message;
  std::string output;
};

call_result call_tag(const quill::tag::library & lib, std::string_view name,
                     quill::store::context & slot,
                     const std::vector<quill::store::value> & args = {}) {
  call_result result{};
  const quill::tag::definition * def = quill::tag::find_tag(lib, name);
  REQUIRE(def != nullptr);
  quill::tag::action::context ctx{};
  quill::tag::sm machine{ctx};
  machine.process_event(quill::tag::event::render_tag{
    .tag = def,
    .args = &args,
    .slot = &slot,
    .output = &result.output,
    .error_out = &result.err,
    .error_message_out = &result.message,
  });
  return result;
}

constexpr std::string_view k_accessor_tags = R"py(
import quill

@quill.simple_tag(takes_context=True)
def read_missing(ctx):
    return ctx["missing"]

@quill.simple_tag(takes_context=True)
def bad_key(ctx):
    return ctx[1]

@quill.simple_tag(takes_context=True)
def delete(ctx):
    del ctx["x"]

@quill.simple_tag(takes_context=True)
def inspect(ctx):
    ctx.set("y", 2)
    return "%s|%s|%s|%d|%s|%s" % (
        ctx.get("x"),
        ctx.get("missing", "fallback"),
        ",".join(ctx.keys()),
        len(ctx),
        "x" in ctx,
        "missing" in ctx,
    )

@quill.simple_tag
def nothing():
    return None

@quill.simple_tag(name="renamed")
def original_name(value):
    return repr(value)
)py";

constexpr std::string_view k_float_tags = R"py(
import quill

@quill.simple_tag(takes_context=True)
def extremes(ctx):
    ctx["huge"] = 1e300
    ctx["nan"] = float("nan")
    ctx["neg_inf"] = float("-inf")
    ctx["sum"] = 0.1 + 0.2
    return str(ctx["sum"])
)py";

TEST_CASE("python_runtime_is_initialized_and_reinitialize_is_noop") {
  CHECK(quill::python::is_initialized());
  CHECK(quill::python::initialize(quill::python::options{}) == QUILL_OK);
}

TEST_CASE("python_run_source_and_eval_string_share_main") {
  std::string error;
  REQUIRE(quill::python::run_source("answer = 6 * 7\n", &error) == QUILL_OK);
  CHECK(eval("answer") == "42");

  std::string out;
  CHECK(quill::python::eval_string("undefined_name", out, &error) == QUILL_ERR_RUNTIME);
  CHECK(error == "NameError: name 'undefined_name' is not defined");
}

TEST_CASE("python_load_tags_reports_syntax_and_import_errors") {
  quill::tag::library lib{};
  std::string error;
  CHECK(quill::python::load_tags("broken_syntax", "def oops(:\n", lib, &error) ==
        QUILL_ERR_RUNTIME);
  CHECK(error.rfind("SyntaxError", 0) == 0);

  CHECK(quill::python::load_tags("broken_import", "raise RuntimeError('bad import')\n", lib,
                                 &error) == QUILL_ERR_RUNTIME);
  CHECK(error == "RuntimeError: bad import");
  CHECK(quill::tag::tag_count(lib) == 0);

  CHECK(quill::python::load_tags("", "x = 1\n", lib, &error) == QUILL_ERR_INVALID_ARGUMENT);
}

TEST_CASE("python_load_tags_registers_decorated_callables") {
  quill::tag::library lib{};
  std::string error;
  REQUIRE(quill::python::load_tags("accessor_tags", k_accessor_tags, lib, &error) == QUILL_OK);
  CHECK(quill::tag::tag_count(lib) == 6);
  REQUIRE(quill::tag::find_tag(lib, "inspect") != nullptr);
  CHECK(quill::tag::find_tag(lib, "inspect")->takes_context);
  REQUIRE(quill::tag::find_tag(lib, "nothing") != nullptr);
  CHECK_FALSE(quill::tag::find_tag(lib, "nothing")->takes_context);
  CHECK(quill::tag::find_tag(lib, "renamed") != nullptr);
  CHECK(quill::tag::find_tag(lib, "original_name") == nullptr);
}

TEST_CASE("python_context_accessors") {
  quill::tag::library lib{};
  REQUIRE(quill::python::load_tags("accessor_tags", k_accessor_tags, lib) == QUILL_OK);

  quill::store::context slot{};
  quill::store::set(slot, "x", quill::store::make_int(1));
  const call_result result = call_tag(lib, "inspect", slot);
  CHECK(result.err == QUILL_OK);
  CHECK(result.output == "1|fallback|x,y|2|True|False");
  CHECK(quill::store::find(slot, "y")->int_v == 2);
}

TEST_CASE("python_context_accessor_failures_raise_python_errors") {
  quill::tag::library lib{};
  REQUIRE(quill::python::load_tags("accessor_tags", k_accessor_tags, lib) == QUILL_OK);

  quill::store::context slot{};
  quill::store::set(slot, "x", quill::store::make_int(1));

  call_result result = call_tag(lib, "read_missing", slot);
  CHECK(result.err == QUILL_ERR_FOREIGN_CALL);
  CHECK(result.message == "KeyError: 'missing'");

  result = call_tag(lib, "bad_key", slot);
  CHECK(result.err == QUILL_ERR_FOREIGN_CALL);
  CHECK(result.message == "TypeError: context keys must be str, not int");

  result = call_tag(lib, "delete", slot);
  CHECK(result.err == QUILL_ERR_FOREIGN_CALL);
  CHECK(result.message == "TypeError: context entries cannot be deleted");
  CHECK(quill::store::find(slot, "x")->int_v == 1);
}

TEST_CASE("python_plain_tag_results_are_stringified") {
  quill::tag::library lib{};
  REQUIRE(quill::python::load_tags("accessor_tags", k_accessor_tags, lib) == QUILL_OK);
  quill::store::context slot{};

  CHECK(call_tag(lib, "nothing", slot).output == "None");

  const std::vector<quill::store::value> args = {quill::store::make_string("hi")};
  CHECK(call_tag(lib, "renamed", slot, args).output == "'hi'");
}

TEST_CASE("python_context_accepts_floats_outside_integer_range") {
  quill::tag::library lib{};
  std::string error;
  REQUIRE_MESSAGE(quill::python::load_tags("float_tags", k_float_tags, lib, &error) == QUILL_OK,
                  error);

  quill::store::context slot{};
  const call_result result = call_tag(lib, "extremes", slot);
  REQUIRE_MESSAGE(result.err == QUILL_OK, result.message);
  CHECK(result.output == "0.30000000000000004");

  const quill::store::value * huge = quill::store::find(slot, "huge");
  REQUIRE(huge != nullptr);
  CHECK(huge->type == quill::store::value_type::floating);
  CHECK(huge->float_v == 1e300);
  REQUIRE(quill::store::contains(slot, "nan"));
  CHECK(std::isnan(quill::store::find(slot, "nan")->float_v));
  CHECK(std::isinf(quill::store::find(slot, "neg_inf")->float_v));
  CHECK(quill::store::find(slot, "sum")->float_v == 0.1 + 0.2);
}

TEST_CASE("python_context_cannot_be_instantiated") {
  std::string error;
  CHECK(quill::python::run_source("import quill\nquill.Context()\n", &error) ==
        QUILL_ERR_RUNTIME);
  CHECK(error.rfind("TypeError", 0) == 0);
}

TEST_CASE("python_value_conversion") {
  quill::python::gil_guard gil;

  PyObject * big = PyLong_FromString("1180591620717411303424", nullptr, 10);
  REQUIRE(big != nullptr);
  quill::store::value v;
  REQUIRE(quill::python::from_python(big, v));
  CHECK(v.type == quill::store::value_type::foreign);
  CHECK(v.foreign_v.get() == big);

  PyObject * back = quill::python::to_python(v);
  CHECK(back == big);
  Py_XDECREF(back);
  v = quill::store::make_undefined();
  Py_DECREF(big);

  REQUIRE(quill::python::from_python(Py_True, v));
  CHECK(v.type == quill::store::value_type::boolean);
  CHECK(v.bool_v);

  REQUIRE(quill::python::from_python(Py_None, v));
  CHECK(v.type == quill::store::value_type::none);

  PyObject * number = PyLong_FromLongLong(-5);
  REQUIRE(quill::python::from_python(number, v));
  Py_DECREF(number);
  CHECK(v.type == quill::store::value_type::integer);
  CHECK(v.int_v == -5);

  PyObject * text = PyUnicode_FromString("caf\xc3\xa9");
  REQUIRE(quill::python::from_python(text, v));
  Py_DECREF(text);
  CHECK(v.type == quill::store::value_type::string);
  CHECK(v.string_v == "caf\xc3\xa9");

  PyObject * none = quill::python::to_python(quill::store::make_undefined());
  CHECK(none == Py_None);
  Py_XDECREF(none);
}

}  // namespace
