#pragma once

#include "quill/quill.h"
#include "quill/renderer/context.hpp"
#include "quill/renderer/detail.hpp"
#include "quill/renderer/events.hpp"

namespace quill::renderer::action {

struct reject_invalid_render {
  void operator()(const event::render & ev, context & ctx) const noexcept {
    ctx.request = nullptr;
    ctx.phase_error = QUILL_ERR_INVALID_ARGUMENT;
    ctx.last_error = QUILL_ERR_INVALID_ARGUMENT;
    ctx.error_message = "invalid render request";
    ctx.error_node = 0;
    if (ev.error_out != nullptr) {
      *ev.error_out = QUILL_ERR_INVALID_ARGUMENT;
    }
    if (ev.error_message_out != nullptr) {
      *ev.error_message_out = ctx.error_message;
    }
    if (ev.error_node_out != nullptr) {
      *ev.error_node_out = 0;
    }
    if (ev.dispatch_error) {
      ev.dispatch_error(events::rendering_error{&ev, QUILL_ERR_INVALID_ARGUMENT, 0});
    }
  }
};

struct begin_render {
  void operator()(const event::render & ev, context & ctx) const noexcept {
    ctx.request = &ev;
    ctx.program = ev.program;
    ctx.library = ev.library;
    ctx.slot = ev.slot;
    ctx.output = ev.output;
    ctx.node_index = 0;
    ctx.phase_error = QUILL_OK;
    ctx.last_error = QUILL_OK;
    ctx.error_message.clear();
    ctx.error_node = 0;
  }
};

struct render_next_node {
  void operator()(context & ctx) const noexcept {
    if (ctx.phase_error != QUILL_OK) {
      return;
    }
    const size_t index = ctx.node_index;
    ctx.node_index += 1;
    if (!detail::render_node(ctx, ctx.program->body[index], 0)) {
      ctx.error_node = index;
    }
  }
};

struct finalize_done {
  void operator()(context & ctx) const noexcept {
    const auto * ev = ctx.request;
    if (ev == nullptr) {
      return;
    }
    if (ev->error_out != nullptr) {
      *ev->error_out = QUILL_OK;
    }
    if (ev->dispatch_done) {
      ev->dispatch_done(events::rendering_done{ev, ctx.output->size()});
    }
  }
};

struct finalize_error {
  void operator()(context & ctx) const noexcept {
    const auto * ev = ctx.request;
    if (ev == nullptr) {
      return;
    }
    if (ev->error_out != nullptr) {
      *ev->error_out = ctx.phase_error;
    }
    if (ev->error_message_out != nullptr) {
      *ev->error_message_out = ctx.error_message;
    }
    if (ev->error_node_out != nullptr) {
      *ev->error_node_out = ctx.error_node;
    }
    if (ev->dispatch_error) {
      ev->dispatch_error(events::rendering_error{ev, ctx.phase_error, ctx.error_node});
    }
  }
};

struct on_unexpected {
  template <class event>
  void operator()(const event &, context & ctx) const noexcept {
    ctx.phase_error = QUILL_ERR_BACKEND;
    ctx.last_error = QUILL_ERR_BACKEND;
  }
};

inline constexpr reject_invalid_render reject_invalid_render{};
inline constexpr begin_render begin_render{};
inline constexpr render_next_node render_next_node{};
inline constexpr finalize_done finalize_done{};
inline constexpr finalize_error finalize_error{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace quill::renderer::action
