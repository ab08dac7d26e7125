#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quill/store/context.hpp"

namespace quill::handle {

// Lock-guarded storage behind every handle. `ctx` is only touched with
// `mutex` held, except by reclamation when the handle is provably unique.
struct cell {
  std::mutex mutex;
  store::context ctx;

  explicit cell(store::context && c) : ctx(std::move(c)) {}
};

using shared = std::shared_ptr<cell>;

// Waits on the cell without any extra cooperation.
struct block_directly {
  template <class Wait>
  void operator()(Wait && wait) const {
    std::forward<Wait>(wait)();
  }
};

inline shared make(store::context && ctx) {
  return std::make_shared<cell>(std::move(ctx));
}

inline shared duplicate(const shared & h) noexcept { return h; }

inline long use_count(const shared & h) noexcept { return h.use_count(); }

/**
 * Acquires exclusive access to the wrapped context.
 *
 * An uncontended cell is taken without blocking. On contention `unblock` is
 * handed a wait function and must run it with the caller's runtime-wide
 * serialization released, so the current holder can finish.
 */
template <class Unblock>
std::unique_lock<std::mutex> lock(const shared & h, Unblock && unblock) {
  std::unique_lock<std::mutex> guard(h->mutex, std::try_to_lock);
  if (!guard.owns_lock()) {
    std::forward<Unblock>(unblock)([&guard] { guard.lock(); });
  }
  return guard;
}

inline std::unique_lock<std::mutex> lock(const shared & h) {
  return lock(h, block_directly{});
}

template <class Unblock>
bool get(const shared & h, const std::string_view name, store::value & out, Unblock && unblock) {
  store::value found;
  {
    auto guard = lock(h, std::forward<Unblock>(unblock));
    if (!store::lookup(h->ctx, name, found)) {
      return false;
    }
  }
  out = std::move(found);
  return true;
}

template <class Unblock>
bool contains(const shared & h, const std::string_view name, Unblock && unblock) {
  auto guard = lock(h, std::forward<Unblock>(unblock));
  return store::contains(h->ctx, name);
}

// The displaced value outlives the guard: releasing it may run foreign
// finalizers, which must not happen with the cell locked.
template <class Unblock>
void set(const shared & h, const std::string_view name, store::value val, Unblock && unblock) {
  store::value displaced;
  auto guard = lock(h, std::forward<Unblock>(unblock));
  displaced = store::assign(h->ctx, name, std::move(val));
  guard.unlock();
}

template <class Unblock>
std::vector<std::string> names(const shared & h, Unblock && unblock) {
  auto guard = lock(h, std::forward<Unblock>(unblock));
  return store::visible_names(h->ctx);
}

inline bool get(const shared & h, const std::string_view name, store::value & out) {
  return get(h, name, out, block_directly{});
}

inline void set(const shared & h, const std::string_view name, store::value val) {
  set(h, name, std::move(val), block_directly{});
}

inline std::vector<std::string> names(const shared & h) {
  return names(h, block_directly{});
}

}  // namespace quill::handle
