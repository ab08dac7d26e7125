#pragma once

#include "quill/tag/context.hpp"
#include "quill/tag/events.hpp"

namespace quill::tag::guard {

inline constexpr auto valid_render_tag = [](const event::render_tag & ev) noexcept {
  if (ev.tag == nullptr || !ev.tag->invoke || ev.output == nullptr) {
    return false;
  }
  if (ev.args != nullptr && ev.args->size() > k_max_tag_args) {
    return false;
  }
  return !ev.tag->takes_context || ev.slot != nullptr;
};

inline constexpr auto invalid_render_tag = [](const event::render_tag & ev) noexcept {
  return !valid_render_tag(ev);
};

struct takes_context {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.request != nullptr && ctx.request->tag->takes_context;
  }
};

struct plain_call {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.request == nullptr || !ctx.request->tag->takes_context;
  }
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

}  // namespace quill::tag::guard
