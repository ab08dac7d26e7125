#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "quill/tag/events.hpp"
#include "quill/tag/library.hpp"

namespace quill::python {

struct options {
  std::string program_name = "quill";
  // Ignore PYTHON* environment variables and the user site directory.
  bool isolated = true;
  bool install_signal_handlers = false;
  // Appended to sys.path after startup.
  std::vector<std::string> module_search_paths = {};
};

/**
 * Starts the embedded interpreter and registers the built-in `quill` module.
 *
 * On success the calling thread releases the GIL; every other entry point
 * acquires it on its own, from any thread. Calling it again while running is
 * a no-op. Returns QUILL_ERR_RUNTIME when startup fails or when an
 * interpreter this module does not own is already running.
 */
int32_t initialize(const options & opts, std::string * error_out = nullptr);

// Must run on the thread that called initialize.
void finalize() noexcept;

bool is_initialized() noexcept;

/**
 * Executes `source` as a fresh module named `module_name` and registers every
 * callable it decorates with `quill.simple_tag` into `lib`.
 *
 * Python failures (syntax errors, exceptions at import time) are
 * QUILL_ERR_RUNTIME with the formatted exception in `error_out`.
 */
int32_t load_tags(std::string_view module_name, std::string_view source, tag::library & lib,
                  std::string * error_out = nullptr);

// tag::invoke_fn target for Python callables.
bool invoke(tag::foreign_call & call) noexcept;

inline tag::invoke_fn invoker() noexcept { return tag::invoke_fn::from<&invoke>(); }

// Executes statements in __main__.
int32_t run_source(std::string_view source, std::string * error_out = nullptr);

// Evaluates an expression in __main__ and writes str() of the result.
int32_t eval_string(std::string_view expression, std::string & out,
                    std::string * error_out = nullptr);

}  // namespace quill::python
