#pragma once

#include <type_traits>
#include <utility>

namespace quill::store {

// Moves the contents out of `slot` and leaves a default-constructed value in
// its place, so the slot stays valid for as long as the value is away.
template <class T>
T take(T & slot) noexcept(std::is_nothrow_default_constructible_v<T> &&
                          std::is_nothrow_move_constructible_v<T> &&
                          std::is_nothrow_move_assignable_v<T>) {
  static_assert(std::is_default_constructible_v<T>, "take requires a default placeholder");
  return std::exchange(slot, T{});
}

// Restores a value into `slot`, discarding the placeholder left by `take`.
template <class T>
void swap_back(T & slot, T && value) noexcept(std::is_nothrow_move_assignable_v<T>) {
  slot = std::move(value);
}

}  // namespace quill::store
