#include <algorithm>
#include <cinttypes>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "bench_common.hpp"

namespace {

using quill::bench::config;
using quill::bench::result;

std::vector<result> run_quill_benchmarks(const config & cfg) {
  std::vector<result> results;
  quill::bench::append_quill_tag_dispatch_cases(results, cfg);
  return results;
}

std::vector<result> run_direct_benchmarks(const config & cfg) {
  std::vector<result> results;
  quill::bench::append_direct_tag_call_cases(results, cfg);
  return results;
}

void print_snapshot(const std::vector<result> & results) {
  for (const auto & entry : results) {
    std::printf("%s ns_per_op=%.3f iter=%" PRIu64 " runs=%zu\n",
                entry.name.c_str(),
                entry.ns_per_op,
                entry.iterations,
                entry.runs);
  }
}

void print_compare(const std::vector<result> & quill_results,
                   const std::vector<result> & direct_results) {
  std::vector<result> quill_sorted = quill_results;
  std::vector<result> direct_sorted = direct_results;

  const auto by_name = [](const result & a, const result & b) { return a.name < b.name; };
  std::sort(quill_sorted.begin(), quill_sorted.end(), by_name);
  std::sort(direct_sorted.begin(), direct_sorted.end(), by_name);

  if (quill_sorted.size() != direct_sorted.size()) {
    std::fprintf(stderr, "error: case count mismatch\n");
    std::exit(1);
  }
  for (std::size_t i = 0; i < quill_sorted.size(); ++i) {
    const auto & quill_entry = quill_sorted[i];
    const auto & direct_entry = direct_sorted[i];
    if (quill_entry.name != direct_entry.name) {
      std::fprintf(stderr, "error: case mismatch %s vs %s\n",
                   quill_entry.name.c_str(), direct_entry.name.c_str());
      std::exit(1);
    }
    const double ratio = quill_entry.ns_per_op / direct_entry.ns_per_op;
    std::printf("%s dispatch %.3f ns/op, direct %.3f ns/op, ratio=%.3fx\n",
                quill_entry.name.c_str(),
                quill_entry.ns_per_op,
                direct_entry.ns_per_op,
                ratio);
  }
}

enum class mode {
  k_dispatch,
  k_direct,
  k_compare,
};

mode parse_mode(int argc, char ** argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--mode=dispatch") {
      return mode::k_dispatch;
    }
    if (arg == "--mode=direct") {
      return mode::k_direct;
    }
    if (arg == "--mode=compare") {
      return mode::k_compare;
    }
  }
  return mode::k_dispatch;
}

}  // namespace

int main(int argc, char ** argv) {
  config cfg;
  cfg.iterations = quill::bench::read_env_u64("QUILL_BENCH_ITERS",
                                              quill::bench::k_default_iterations);
  cfg.runs = quill::bench::read_env_size("QUILL_BENCH_RUNS", quill::bench::k_default_runs);
  cfg.warmup_iterations = quill::bench::read_env_u64(
    "QUILL_BENCH_WARMUP_ITERS",
    std::min(cfg.iterations, quill::bench::k_default_warmup_iterations));
  cfg.warmup_runs = quill::bench::read_env_size("QUILL_BENCH_WARMUP_RUNS",
                                                quill::bench::k_default_warmup_runs);
  if (cfg.iterations == 0) {
    cfg.iterations = quill::bench::k_default_iterations;
  }

  const mode run_mode = parse_mode(argc, argv);

  if (run_mode == mode::k_dispatch) {
    print_snapshot(run_quill_benchmarks(cfg));
    return 0;
  }

  if (run_mode == mode::k_direct) {
    print_snapshot(run_direct_benchmarks(cfg));
    return 0;
  }

  print_compare(run_quill_benchmarks(cfg), run_direct_benchmarks(cfg));
  return 0;
}
