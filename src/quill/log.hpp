#pragma once

#include <memory>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace quill::log {

inline constexpr const char * k_logger_name = "quill";

// Process-wide logger. Levels follow SPDLOG_LEVEL (e.g. "quill=debug").
inline spdlog::logger & get() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    spdlog::cfg::load_env_levels();
    std::shared_ptr<spdlog::logger> existing = spdlog::get(k_logger_name);
    if (existing != nullptr) {
      return existing;
    }
    return spdlog::stderr_color_mt(k_logger_name);
  }();
  return *logger;
}

}  // namespace quill::log
