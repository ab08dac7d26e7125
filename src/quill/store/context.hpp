#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quill/store/value.hpp"

namespace quill::store {

inline constexpr size_t k_max_frames = 64;

struct entry {
  std::string name = {};
  value val = {};
};

struct frame {
  std::vector<entry> entries = {};
};

/**
 * Scoped name store for one render.
 *
 * `frames.front()` is the base frame and always exists; `frames.back()` is the
 * innermost scope. Copying a context duplicates every frame and retains every
 * foreign value once, so a copy is independent of its source.
 */
struct context {
  std::vector<frame> frames;

  context() : frames(1) {}
};

inline const entry * find_entry(const frame & f, const std::string_view name) noexcept {
  for (const entry & e : f.entries) {
    if (e.name == name) {
      return &e;
    }
  }
  return nullptr;
}

inline entry * find_entry_mut(frame & f, const std::string_view name) noexcept {
  for (entry & e : f.entries) {
    if (e.name == name) {
      return &e;
    }
  }
  return nullptr;
}

inline const value * find(const context & ctx, const std::string_view name) noexcept {
  for (size_t i = ctx.frames.size(); i > 0; --i) {
    const entry * e = find_entry(ctx.frames[i - 1], name);
    if (e != nullptr) {
      return &e->val;
    }
  }
  return nullptr;
}

inline bool lookup(const context & ctx, const std::string_view name, value & out) {
  const value * found = find(ctx, name);
  if (found == nullptr) {
    return false;
  }
  out = *found;
  return true;
}

inline bool contains(const context & ctx, const std::string_view name) noexcept {
  return find(ctx, name) != nullptr;
}

// Writes into the innermost frame and returns whatever the name held there
// before (undefined when it was new to that frame).
inline value assign(context & ctx, const std::string_view name, value val) {
  frame & inner = ctx.frames.back();
  entry * existing = find_entry_mut(inner, name);
  if (existing != nullptr) {
    return std::exchange(existing->val, std::move(val));
  }
  inner.entries.push_back(entry{std::string(name), std::move(val)});
  return make_undefined();
}

inline void set(context & ctx, const std::string_view name, value val) {
  assign(ctx, name, std::move(val));
}

inline bool push_frame(context & ctx) {
  if (ctx.frames.size() >= k_max_frames) {
    return false;
  }
  ctx.frames.emplace_back();
  return true;
}

inline bool pop_frame(context & ctx) noexcept {
  if (ctx.frames.size() <= 1) {
    return false;
  }
  ctx.frames.pop_back();
  return true;
}

inline size_t depth(const context & ctx) noexcept { return ctx.frames.size(); }

// Names visible from the innermost frame, innermost first, shadowed duplicates
// dropped.
inline std::vector<std::string> visible_names(const context & ctx) {
  std::vector<std::string> names;
  for (size_t i = ctx.frames.size(); i > 0; --i) {
    for (const entry & e : ctx.frames[i - 1].entries) {
      bool seen = false;
      for (const std::string & existing : names) {
        if (existing == e.name) {
          seen = true;
          break;
        }
      }
      if (!seen) {
        names.push_back(e.name);
      }
    }
  }
  return names;
}

// True for the freshly default-constructed state left behind by `take`.
inline bool is_placeholder(const context & ctx) noexcept {
  return ctx.frames.size() == 1 && ctx.frames.front().entries.empty();
}

inline context duplicate(const context & ctx) { return ctx; }

}  // namespace quill::store
