#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include "quill/quill.h"
#include "quill/tag/events.hpp"

namespace quill::tag {

// Registered tags for one template environment. The consuming/plain mode is
// fixed here, per definition, and never re-derived per call.
struct library {
  std::vector<definition> tags = {};
};

inline const definition * find_tag(const library & lib, const std::string_view name) noexcept {
  for (const definition & def : lib.tags) {
    if (def.name == name) {
      return &def;
    }
  }
  return nullptr;
}

// Adds `def`, replacing an earlier definition with the same name.
inline int32_t register_tag(library & lib, definition def) {
  if (def.name.empty() || !def.invoke) {
    return QUILL_ERR_INVALID_ARGUMENT;
  }
  for (definition & existing : lib.tags) {
    if (existing.name == def.name) {
      existing = std::move(def);
      return QUILL_OK;
    }
  }
  lib.tags.push_back(std::move(def));
  return QUILL_OK;
}

inline size_t tag_count(const library & lib) noexcept { return lib.tags.size(); }

}  // namespace quill::tag
