#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

namespace quill::bench {

inline constexpr std::uint64_t k_default_iterations = 100000;
inline constexpr std::size_t k_default_runs = 5;
inline constexpr std::uint64_t k_default_warmup_iterations = 1000;
inline constexpr std::size_t k_default_warmup_runs = 1;
inline constexpr std::size_t k_max_runs = 25;

struct config {
  std::uint64_t iterations = k_default_iterations;
  std::size_t runs = k_default_runs;
  std::uint64_t warmup_iterations = k_default_warmup_iterations;
  std::size_t warmup_runs = k_default_warmup_runs;
};

struct result {
  std::string name;
  double ns_per_op = 0.0;
  std::uint64_t iterations = 0;
  std::size_t runs = 0;
};

inline std::uint64_t read_env_u64(const char * name, std::uint64_t fallback) {
  const char * value = std::getenv(name);
  if (value == nullptr || value[0] == '\0') {
    return fallback;
  }
  char * end = nullptr;
  const auto parsed = std::strtoull(value, &end, 10);
  if (end == value) {
    return fallback;
  }
  return static_cast<std::uint64_t>(parsed);
}

inline std::size_t read_env_size(const char * name, std::size_t fallback) {
  const auto parsed = read_env_u64(name, static_cast<std::uint64_t>(fallback));
  if (parsed == 0) {
    return fallback;
  }
  if (parsed > static_cast<std::uint64_t>(k_max_runs)) {
    return k_max_runs;
  }
  return static_cast<std::size_t>(parsed);
}

// Median ns/op over `cfg.runs` timed runs.
template <class Fn>
result measure_case(const char * name, const config & cfg, Fn && fn) {
  std::vector<double> samples;
  samples.reserve(cfg.runs);

  for (std::size_t run = 0; run < cfg.warmup_runs; ++run) {
    for (std::uint64_t i = 0; i < cfg.warmup_iterations; ++i) {
      fn();
    }
  }

  for (std::size_t run = 0; run < cfg.runs; ++run) {
    const auto start = std::chrono::steady_clock::now();
    for (std::uint64_t i = 0; i < cfg.iterations; ++i) {
      fn();
    }
    const auto end = std::chrono::steady_clock::now();
    const auto duration_ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    samples.push_back(static_cast<double>(duration_ns) / static_cast<double>(cfg.iterations));
  }

  std::sort(samples.begin(), samples.end());
  const double median = samples[samples.size() / 2];

  result out;
  out.name = name;
  out.ns_per_op = median;
  out.iterations = cfg.iterations;
  out.runs = cfg.runs;
  return out;
}

void append_quill_tag_dispatch_cases(std::vector<result> & results, const config & cfg);
void append_direct_tag_call_cases(std::vector<result> & results, const config & cfg);

}  // namespace quill::bench
