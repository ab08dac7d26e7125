#pragma once

#include <type_traits>

namespace quill {

template <class Signature>
class callback;

// Non-owning reference to a free function or to a member function bound to an
// object. An empty callback yields a value-initialised result.
template <class R, class... Args>
class callback<R(Args...)> {
  static_assert(!std::is_void_v<R>, "callbacks report a result");

 public:
  constexpr callback() noexcept = default;

  constexpr explicit operator bool() const noexcept { return trampoline_ != nullptr; }

  R operator()(Args... args) const noexcept {
    if (trampoline_ == nullptr) {
      return R{};
    }
    return trampoline_(target_, static_cast<Args>(args)...);
  }

  template <auto Fn>
  static constexpr callback from() noexcept {
    return callback{nullptr, &call_free<Fn>};
  }

  template <class T, auto MemFn>
  static constexpr callback from(T * obj) noexcept {
    return callback{obj, &call_member<T, MemFn>};
  }

 private:
  using trampoline_fn = R (*)(void *, Args...);

  constexpr callback(void * target, trampoline_fn fn) noexcept
      : target_(target), trampoline_(fn) {}

  template <auto Fn>
  static R call_free(void *, Args... args) {
    return Fn(static_cast<Args>(args)...);
  }

  template <class T, auto MemFn>
  static R call_member(void * target, Args... args) {
    return (static_cast<T *>(target)->*MemFn)(static_cast<Args>(args)...);
  }

  void * target_ = nullptr;
  trampoline_fn trampoline_ = nullptr;
};

}  // namespace quill
