#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace quill::store {

enum class value_type : uint8_t {
  undefined = 0,
  none = 1,
  boolean = 2,
  integer = 3,
  floating = 4,
  string = 5,
  foreign = 6
};

// Reference management for objects owned by the embedded runtime. The store
// never inspects a foreign object; it only counts references through these.
struct foreign_ops {
  void (*retain)(void * object) noexcept = nullptr;
  void (*release)(void * object) noexcept = nullptr;
  bool (*to_string)(void * object, std::string & out, std::string & error) noexcept = nullptr;
};

// One counted reference to a foreign object. Copying retains, destruction
// releases.
class foreign_ref {
 public:
  foreign_ref() noexcept = default;

  static foreign_ref adopt(void * object, const foreign_ops * ops) noexcept {
    foreign_ref out;
    out.object_ = object;
    out.ops_ = object != nullptr ? ops : nullptr;
    return out;
  }

  static foreign_ref borrow(void * object, const foreign_ops * ops) noexcept {
    if (object != nullptr && ops != nullptr && ops->retain != nullptr) {
      ops->retain(object);
    }
    return adopt(object, ops);
  }

  foreign_ref(const foreign_ref & other) noexcept : object_(other.object_), ops_(other.ops_) {
    if (object_ != nullptr && ops_ != nullptr && ops_->retain != nullptr) {
      ops_->retain(object_);
    }
  }

  foreign_ref(foreign_ref && other) noexcept
      : object_(std::exchange(other.object_, nullptr)),
        ops_(std::exchange(other.ops_, nullptr)) {}

  foreign_ref & operator=(const foreign_ref & other) noexcept {
    if (this != &other) {
      foreign_ref copy(other);
      swap(copy);
    }
    return *this;
  }

  foreign_ref & operator=(foreign_ref && other) noexcept {
    if (this != &other) {
      reset();
      object_ = std::exchange(other.object_, nullptr);
      ops_ = std::exchange(other.ops_, nullptr);
    }
    return *this;
  }

  ~foreign_ref() { reset(); }

  void reset() noexcept {
    void * object = std::exchange(object_, nullptr);
    const foreign_ops * ops = std::exchange(ops_, nullptr);
    if (object != nullptr && ops != nullptr && ops->release != nullptr) {
      ops->release(object);
    }
  }

  void swap(foreign_ref & other) noexcept {
    std::swap(object_, other.object_);
    std::swap(ops_, other.ops_);
  }

  void * get() const noexcept { return object_; }
  const foreign_ops * ops() const noexcept { return ops_; }
  explicit operator bool() const noexcept { return object_ != nullptr; }

 private:
  void * object_ = nullptr;
  const foreign_ops * ops_ = nullptr;
};

struct value {
  value_type type = value_type::undefined;
  bool bool_v = false;
  int64_t int_v = 0;
  double float_v = 0.0;
  std::string string_v = {};
  foreign_ref foreign_v = {};
};

inline value make_undefined() noexcept { return value{}; }

inline value make_none() noexcept {
  value v;
  v.type = value_type::none;
  return v;
}

inline value make_bool(const bool b) noexcept {
  value v;
  v.type = value_type::boolean;
  v.bool_v = b;
  return v;
}

inline value make_int(const int64_t i) noexcept {
  value v;
  v.type = value_type::integer;
  v.int_v = i;
  v.float_v = static_cast<double>(i);
  return v;
}

inline value make_float(const double d) noexcept {
  value v;
  v.type = value_type::floating;
  v.float_v = d;
  return v;
}

inline value make_string(std::string_view text) {
  value v;
  v.type = value_type::string;
  v.string_v.assign(text.data(), text.size());
  return v;
}

inline value make_foreign(foreign_ref ref) noexcept {
  value v;
  v.type = ref ? value_type::foreign : value_type::none;
  v.foreign_v = std::move(ref);
  return v;
}

inline bool is_defined(const value & v) noexcept {
  return v.type != value_type::undefined;
}

// Structural equality. Foreign values compare by identity.
inline bool value_equal(const value & a, const value & b) noexcept {
  if (a.type != b.type) {
    return false;
  }
  switch (a.type) {
    case value_type::undefined:
    case value_type::none:
      return true;
    case value_type::boolean:
      return a.bool_v == b.bool_v;
    case value_type::integer:
      return a.int_v == b.int_v;
    case value_type::floating:
      return a.float_v == b.float_v;
    case value_type::string:
      return a.string_v == b.string_v;
    case value_type::foreign:
      return a.foreign_v.get() == b.foreign_v.get();
  }
  return false;
}

}  // namespace quill::store
