#pragma once

#include <string>
#include <utility>
#include <vector>

#include "quill/handle/reclaim.hpp"
#include "quill/handle/shared_context.hpp"
#include "quill/log.hpp"
#include "quill/quill.h"
#include "quill/store/ownership.hpp"
#include "quill/tag/context.hpp"
#include "quill/tag/events.hpp"

namespace quill::tag::action {

namespace detail {

inline const std::vector<store::value> k_no_args = {};

inline void set_error(context & ctx, const int32_t err, std::string message) noexcept {
  if (ctx.phase_error == QUILL_OK) {
    ctx.phase_error = err;
    ctx.last_error = err;
    ctx.error_message = std::move(message);
  }
}

inline bool run_invoke(context & ctx) noexcept {
  const definition & tag = *ctx.request->tag;
  ctx.call.callable = tag.callable.get();
  ctx.call.args = ctx.request->args != nullptr ? ctx.request->args : &k_no_args;
  ctx.call.fragment.clear();
  ctx.call.error_message.clear();
  ctx.invocations += 1;

  if (tag.invoke(ctx.call)) {
    return true;
  }
  ctx.failures += 1;
  log::get().warn("tag '{}' failed: {}", tag.name, ctx.call.error_message);
  set_error(ctx, QUILL_ERR_FOREIGN_CALL, std::move(ctx.call.error_message));
  return false;
}

}  // namespace detail

struct reject_invalid_render_tag {
  void operator()(const event::render_tag & ev, context & ctx) const noexcept {
    ctx.request = nullptr;
    ctx.phase_error = QUILL_ERR_INVALID_ARGUMENT;
    ctx.last_error = QUILL_ERR_INVALID_ARGUMENT;
    ctx.error_message = "invalid render_tag request";
    ctx.last_reclaim = handle::reclaim_path::none;
    if (ev.error_out != nullptr) {
      *ev.error_out = QUILL_ERR_INVALID_ARGUMENT;
    }
    if (ev.error_message_out != nullptr) {
      *ev.error_message_out = ctx.error_message;
    }
    if (ev.reclaim_out != nullptr) {
      *ev.reclaim_out = handle::reclaim_path::none;
    }
    if (ev.dispatch_error) {
      ev.dispatch_error(events::tag_error{&ev, QUILL_ERR_INVALID_ARGUMENT, handle::reclaim_path::none});
    }
  }
};

struct begin_dispatch {
  void operator()(const event::render_tag & ev, context & ctx) const noexcept {
    ctx.request = &ev;
    ctx.slot = ev.slot;
    ctx.phase_error = QUILL_OK;
    ctx.last_error = QUILL_OK;
    ctx.error_message.clear();
    ctx.escrow.reset();
    ctx.call = foreign_call{};
    ctx.last_reclaim = handle::reclaim_path::none;
  }
};

struct invoke_plain {
  void operator()(context & ctx) const noexcept { detail::run_invoke(ctx); }
};

// take -> wrap -> duplicate. The call site keeps `escrow`; the duplicate is
// what the callee receives.
struct escrow_context {
  void operator()(context & ctx) const noexcept {
    store::context owned = store::take(*ctx.slot);
    ctx.escrow = handle::make(std::move(owned));
    ctx.call.handle = handle::duplicate(ctx.escrow);
    ctx.context_invocations += 1;
  }
};

struct invoke_with_context {
  void operator()(context & ctx) const noexcept {
    detail::run_invoke(ctx);
    // Whatever the callee did not take ownership of is dropped here, before
    // reclamation counts references.
    ctx.call.handle.reset();
  }
};

struct reclaim_context {
  void operator()(context & ctx) const noexcept {
    ctx.reclaimed = handle::reclaim(std::move(ctx.escrow), ctx.last_reclaim);
    if (ctx.last_reclaim == handle::reclaim_path::unique) {
      ctx.unique_reclaims += 1;
    } else {
      ctx.deep_copy_reclaims += 1;
    }
  }
};

struct restore_context {
  void operator()(context & ctx) const noexcept {
    store::swap_back(*ctx.slot, std::move(ctx.reclaimed));
  }
};

struct finalize_done {
  void operator()(context & ctx) const noexcept {
    const auto * ev = ctx.request;
    if (ev == nullptr) {
      return;
    }
    ev->output->append(ctx.call.fragment);
    if (ev->error_out != nullptr) {
      *ev->error_out = QUILL_OK;
    }
    if (ev->reclaim_out != nullptr) {
      *ev->reclaim_out = ctx.last_reclaim;
    }
    if (ev->dispatch_done) {
      ev->dispatch_done(events::tag_done{ev, ctx.call.fragment.size(), ctx.last_reclaim});
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
    if (ev->reclaim_out != nullptr) {
      *ev->reclaim_out = ctx.last_reclaim;
    }
    if (ev->dispatch_error) {
      ev->dispatch_error(events::tag_error{ev, ctx.phase_error, ctx.last_reclaim});
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

inline constexpr reject_invalid_render_tag reject_invalid_render_tag{};
inline constexpr begin_dispatch begin_dispatch{};
inline constexpr invoke_plain invoke_plain{};
inline constexpr escrow_context escrow_context{};
inline constexpr invoke_with_context invoke_with_context{};
inline constexpr reclaim_context reclaim_context{};
inline constexpr restore_context restore_context{};
inline constexpr finalize_done finalize_done{};
inline constexpr finalize_error finalize_error{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace quill::tag::action
