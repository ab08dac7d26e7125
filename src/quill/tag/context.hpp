#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "quill/handle/reclaim.hpp"
#include "quill/handle/shared_context.hpp"
#include "quill/quill.h"
#include "quill/store/context.hpp"
#include "quill/tag/events.hpp"

namespace quill::tag::action {

struct context {
  int32_t phase_error = QUILL_OK;
  int32_t last_error = QUILL_OK;
  std::string error_message = {};
  const event::render_tag * request = nullptr;

  store::context * slot = nullptr;
  handle::shared escrow = {};
  store::context reclaimed = {};
  foreign_call call = {};
  handle::reclaim_path last_reclaim = handle::reclaim_path::none;

  uint64_t invocations = 0;
  uint64_t context_invocations = 0;
  uint64_t unique_reclaims = 0;
  uint64_t deep_copy_reclaims = 0;
  uint64_t failures = 0;
};

}  // namespace quill::tag::action
