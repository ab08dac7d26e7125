#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "quill/quill.h"
#include "quill/renderer/events.hpp"
#include "quill/tag/sm.hpp"

namespace quill::renderer::action {

inline constexpr size_t k_max_render_depth = 32;

struct context {
  int32_t phase_error = QUILL_OK;
  int32_t last_error = QUILL_OK;
  std::string error_message = {};
  size_t error_node = 0;
  const event::render * request = nullptr;

  const ::quill::renderer::program * program = nullptr;
  const ::quill::tag::library * library = nullptr;
  store::context * slot = nullptr;
  std::string * output = nullptr;
  size_t node_index = 0;

  tag::action::context tag_ctx = {};
  tag::sm tag_machine{tag_ctx};
  uint64_t tags_rendered = 0;
};

}  // namespace quill::renderer::action
