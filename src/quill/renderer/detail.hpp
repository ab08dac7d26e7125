#pragma once

#include <charconv>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "quill/handle/reclaim.hpp"
#include "quill/quill.h"
#include "quill/renderer/context.hpp"
#include "quill/renderer/program.hpp"
#include "quill/store/context.hpp"
#include "quill/tag/library.hpp"
#include "quill/tag/sm.hpp"

namespace quill::renderer::detail {

inline void set_error(action::context & ctx, const int32_t err, std::string message) noexcept {
  if (ctx.phase_error == QUILL_OK) {
    ctx.phase_error = err;
    ctx.last_error = err;
    ctx.error_message = std::move(message);
  }
}

inline bool write_value(action::context & ctx, const store::value & v) noexcept {
  std::string & out = *ctx.output;
  switch (v.type) {
    case store::value_type::undefined:
    case store::value_type::none:
      return true;
    case store::value_type::boolean:
      out.append(v.bool_v ? "true" : "false");
      return true;
    case store::value_type::integer:
      out.append(std::to_string(v.int_v));
      return true;
    case store::value_type::floating: {
      // Shortest form that round-trips.
      char buffer[64] = {};
      const std::to_chars_result written =
        std::to_chars(buffer, buffer + sizeof(buffer), v.float_v);
      if (written.ec == std::errc{}) {
        out.append(buffer, written.ptr);
      }
      return true;
    }
    case store::value_type::string:
      out.append(v.string_v);
      return true;
    case store::value_type::foreign: {
      const store::foreign_ops * ops = v.foreign_v.ops();
      if (ops == nullptr || ops->to_string == nullptr) {
        set_error(ctx, QUILL_ERR_INVALID_ARGUMENT, "foreign value has no string form");
        return false;
      }
      std::string text;
      std::string error;
      if (!ops->to_string(v.foreign_v.get(), text, error)) {
        set_error(ctx, QUILL_ERR_FOREIGN_CALL, std::move(error));
        return false;
      }
      out.append(text);
      return true;
    }
  }
  return true;
}

inline std::vector<store::value> resolve_args(const action::context & ctx, const node & n) {
  std::vector<store::value> out;
  out.reserve(n.args.size());
  for (const argument & arg : n.args) {
    if (!arg.is_variable) {
      out.push_back(arg.literal);
      continue;
    }
    const store::value * found = store::find(*ctx.slot, arg.name);
    out.push_back(found != nullptr ? *found : store::make_undefined());
  }
  return out;
}

inline bool render_nodes(action::context & ctx, const std::vector<node> & nodes, size_t depth) noexcept;

inline bool render_variable(action::context & ctx, const node & n) noexcept {
  const store::value * found = store::find(*ctx.slot, n.text);
  if (found == nullptr) {
    return true;
  }
  return write_value(ctx, *found);
}

inline bool render_tag(action::context & ctx, const node & n) noexcept {
  const tag::definition * def = tag::find_tag(*ctx.library, n.text);
  if (def == nullptr) {
    set_error(ctx, QUILL_ERR_NOT_FOUND, "unknown tag '" + n.text + "'");
    return false;
  }
  const std::vector<store::value> args = resolve_args(ctx, n);

  int32_t err = QUILL_OK;
  std::string message;
  ctx.tag_machine.process_event(tag::event::render_tag{
    .tag = def,
    .args = &args,
    .slot = ctx.slot,
    .output = ctx.output,
    .error_out = &err,
    .error_message_out = &message,
  });
  ctx.tags_rendered += 1;
  if (err != QUILL_OK) {
    set_error(ctx, err, std::move(message));
    return false;
  }
  return true;
}

inline bool render_block(action::context & ctx, const node & n, const size_t depth) noexcept {
  if (!store::push_frame(*ctx.slot)) {
    set_error(ctx, QUILL_ERR_BACKEND, "scope depth exceeded");
    return false;
  }
  for (const store::entry & binding : n.bindings) {
    store::set(*ctx.slot, binding.name, binding.val);
  }
  const bool ok = render_nodes(ctx, n.body, depth + 1);
  store::pop_frame(*ctx.slot);
  return ok;
}

inline bool render_node(action::context & ctx, const node & n, const size_t depth) noexcept {
  if (depth > action::k_max_render_depth) {
    set_error(ctx, QUILL_ERR_BACKEND, "render depth exceeded");
    return false;
  }
  switch (n.kind) {
    case node_kind::text:
      ctx.output->append(n.text);
      return true;
    case node_kind::variable:
      return render_variable(ctx, n);
    case node_kind::tag:
      return render_tag(ctx, n);
    case node_kind::block:
      return render_block(ctx, n, depth);
  }
  set_error(ctx, QUILL_ERR_INVALID_ARGUMENT, "unknown node kind");
  return false;
}

inline bool render_nodes(action::context & ctx, const std::vector<node> & nodes,
                         const size_t depth) noexcept {
  for (const node & n : nodes) {
    if (!render_node(ctx, n, depth)) {
      return false;
    }
  }
  return true;
}

}  // namespace quill::renderer::detail
