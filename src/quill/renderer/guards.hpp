#pragma once

#include "quill/renderer/context.hpp"
#include "quill/renderer/events.hpp"

namespace quill::renderer::guard {

inline constexpr auto valid_render = [](const event::render & ev) noexcept {
  return ev.program != nullptr && ev.library != nullptr && ev.slot != nullptr &&
         ev.output != nullptr && !ev.slot->frames.empty();
};

inline constexpr auto invalid_render = [](const event::render & ev) noexcept {
  return !valid_render(ev);
};

struct phase_ok {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error == QUILL_OK;
  }
};

struct phase_failed {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error != QUILL_OK;
  }
};

struct has_node_work {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.program != nullptr && ctx.node_index < ctx.program->body.size();
  }
};

struct no_node_work {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.program == nullptr || ctx.node_index >= ctx.program->body.size();
  }
};

}  // namespace quill::renderer::guard
