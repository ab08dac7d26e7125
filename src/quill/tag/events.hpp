#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "quill/callback.hpp"
#include "quill/handle/reclaim.hpp"
#include "quill/handle/shared_context.hpp"
#include "quill/store/context.hpp"
#include "quill/store/value.hpp"

namespace quill::tag {

inline constexpr size_t k_max_tag_args = 16;

// One invocation as seen by the embedded runtime. For a context-consuming
// tag `handle` holds a duplicate the callee owns and may keep.
struct foreign_call {
  void * callable = nullptr;
  ::quill::handle::shared handle = {};
  const std::vector<store::value> * args = nullptr;
  std::string fragment = {};
  std::string error_message = {};
};

using invoke_fn = ::quill::callback<bool(foreign_call &)>;

struct definition {
  std::string name = {};
  bool takes_context = false;
  store::foreign_ref callable = {};
  invoke_fn invoke = {};
};

}  // namespace quill::tag

namespace quill::tag::events {

struct tag_done;
struct tag_error;

}  // namespace quill::tag::events

namespace quill::tag::event {

struct render_tag {
  const definition * tag = nullptr;
  const std::vector<store::value> * args = nullptr;
  store::context * slot = nullptr;
  std::string * output = nullptr;
  int32_t * error_out = nullptr;
  std::string * error_message_out = nullptr;
  handle::reclaim_path * reclaim_out = nullptr;
  ::quill::callback<bool(const ::quill::tag::events::tag_done &)> dispatch_done = {};
  ::quill::callback<bool(const ::quill::tag::events::tag_error &)> dispatch_error = {};
};

}  // namespace quill::tag::event

namespace quill::tag::events {

struct tag_done {
  const event::render_tag * request = nullptr;
  size_t fragment_length = 0;
  handle::reclaim_path reclaim = handle::reclaim_path::none;
};

struct tag_error {
  const event::render_tag * request = nullptr;
  int32_t err = 0;
  handle::reclaim_path reclaim = handle::reclaim_path::none;
};

}  // namespace quill::tag::events
