#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "quill/callback.hpp"
#include "quill/renderer/program.hpp"
#include "quill/store/context.hpp"
#include "quill/tag/library.hpp"

namespace quill::renderer::events {

struct rendering_done;
struct rendering_error;

}  // namespace quill::renderer::events

namespace quill::renderer::event {

struct render {
  const ::quill::renderer::program * program = nullptr;
  const ::quill::tag::library * library = nullptr;
  store::context * slot = nullptr;
  std::string * output = nullptr;
  int32_t * error_out = nullptr;
  std::string * error_message_out = nullptr;
  size_t * error_node_out = nullptr;
  ::quill::callback<bool(const ::quill::renderer::events::rendering_done &)> dispatch_done = {};
  ::quill::callback<bool(const ::quill::renderer::events::rendering_error &)> dispatch_error = {};
};

}  // namespace quill::renderer::event

namespace quill::renderer::events {

struct rendering_done {
  const event::render * request = nullptr;
  size_t output_length = 0;
};

struct rendering_error {
  const event::render * request = nullptr;
  int32_t err = 0;
  size_t error_node = 0;
};

}  // namespace quill::renderer::events
