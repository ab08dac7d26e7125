#pragma once

#include <cstdint>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

#include "quill/handle/shared_context.hpp"
#include "quill/log.hpp"
#include "quill/store/context.hpp"

namespace quill::handle {

enum class reclaim_path : uint8_t {
  none = 0,
  unique = 1,
  deep_copy = 2
};

inline const char * reclaim_path_name(const reclaim_path path) noexcept {
  switch (path) {
    case reclaim_path::unique:
      return "unique";
    case reclaim_path::deep_copy:
      return "deep_copy";
    case reclaim_path::none:
      break;
  }
  return "none";
}

// try_lock may fail spuriously, so an uncontended cell gets a few attempts
// before a failure is treated as a held lock.
inline constexpr int k_unique_lock_attempts = 8;

/**
 * Recovers an owned context from the call site's handle.
 *
 * - unique: no other reference survives, so the context is moved out without
 *   copying. The cell must be unlocked at this point; finding it locked after
 *   k_unique_lock_attempts tries means someone holds the lock without holding
 *   a reference, which cannot happen under the accessor discipline and
 *   terminates.
 * - deep_copy: the foreign side retained a duplicate. The context is copied
 *   under the lock, retaining every foreign value, and the retained handle
 *   keeps the original.
 *
 * `h` is always empty on return.
 */
inline store::context reclaim(shared && h, reclaim_path & path_out) {
  shared owned = std::move(h);
  if (owned.use_count() == 1) {
    std::unique_lock<std::mutex> guard(owned->mutex, std::try_to_lock);
    for (int attempt = 1; !guard.owns_lock() && attempt < k_unique_lock_attempts; ++attempt) {
      std::this_thread::yield();
      guard.try_lock();
    }
    if (!guard.owns_lock()) {
      log::get().critical("reclaim: unique handle found locked");
      std::terminate();
    }
    store::context out = std::move(owned->ctx);
    guard.unlock();
    owned.reset();
    path_out = reclaim_path::unique;
    return out;
  }

  const long holders = owned.use_count();
  store::context out;
  {
    std::lock_guard<std::mutex> guard(owned->mutex);
    out = store::duplicate(owned->ctx);
  }
  owned.reset();
  path_out = reclaim_path::deep_copy;
  log::get().debug("reclaim: handle escaped ({} holders), deep-copied {} frames", holders,
                   out.frames.size());
  return out;
}

}  // namespace quill::handle
