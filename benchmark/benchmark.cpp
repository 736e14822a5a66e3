#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "benchmark_utils.hpp"

// Change to 20 for larger tables
// NOTE: This may take a long time to run, for a quick test, use 14 or 16
constexpr size_t BUCKET_COUNT_LOG2 = 16;
constexpr size_t BUCKET_COUNT = 1UZ << BUCKET_COUNT_LOG2;

// Elements inserted per bucket, in tenths (load is relative to the bucket, not to the slots)
const std::vector<size_t> LOADS = {5, 10, 20, 30, 40, 50, 60, 80};

/***********
 * Helpers *
 ***********/
auto index_formatter(const std::vector<std::string> &arguments) -> std::string {
  const size_t n = std::stoul(arguments[1]);
  return fmt::format("{:.1f}/bucket ({})",
                     static_cast<double>(n) / static_cast<double>(BUCKET_COUNT), n);
}

auto throughput_formatter(const double value, const std::vector<std::string> &arguments)
    -> std::string {
  return fmt::format("{:.3f}", static_cast<double>(std::stoul(arguments[1])) / value / 1'000'000.0);
}

auto multiply_formatter(const double multiplier, const size_t fixed = 3)
    -> std::function<std::string(const double, const std::vector<std::string> &)> {
  return [multiplier, fixed](const double value, const std::vector<std::string> &) {
    return fmt::format("{:.{}f}", value * multiplier, fixed);
  };
}

void benchmark_loads(BenchmarkBase &benchmark, const std::string &name) {
  spdlog::info("Benchmarking {}...", name);
  for (const size_t load : LOADS) {
    const size_t n = BUCKET_COUNT * load / 10;
    spdlog::info("Testing {} with 2^{} buckets and {} elements", name, BUCKET_COUNT_LOG2, n);
    benchmark.benchmark_all(BUCKET_COUNT_LOG2, n);
  }
  spdlog::info("Benchmarking {} done.\n", name);
}

/*********************
 * Construction time *
 *********************/
BENCHMARK("construction time") {
  spdlog::info("Benchmarking {}...", name);
  for (const size_t buckets_log2 : {12UZ, 16UZ, 20UZ, 24UZ}) {
    spdlog::info("Testing {} with 2^{} buckets", name, buckets_log2);
    benchmark_all(buckets_log2, 1UZ);
  }
  spdlog::info("Benchmarking {} done.\n", name);

  spdlog::info("Construction time (μs):");
  summarize([](const std::vector<std::string> &arguments) { return "2^" + arguments[0]; },
            multiply_formatter(1'000'000));
}

/**************
 * Throughput *
 **************/
BENCHMARK("insertion throughput") {
  benchmark_loads(*this, name);

  spdlog::info("Insertion throughput (Mops):");
  summarize(index_formatter, throughput_formatter);
  spdlog::info("Insertion total time (ms):");
  summarize(index_formatter, multiply_formatter(1'000));
}

BENCHMARK("positive query throughput") {
  benchmark_loads(*this, name);

  // The task reports Mops itself, counting only the elements that were stored
  spdlog::info("Positive query throughput (Mops):");
  summarize(index_formatter, multiply_formatter(1));
}

BENCHMARK("negative query throughput") {
  benchmark_loads(*this, name);

  spdlog::info("Negative query throughput (Mops):");
  summarize(index_formatter, throughput_formatter);
}

/***********************
 * False positive rate *
 ***********************/
BENCHMARK("false positive rate") {
  benchmark_loads(*this, name);

  spdlog::info("False positive rate (%):");
  summarize(index_formatter, multiply_formatter(100));
}

/*************
 * Drop rate *
 *************/
BENCHMARK("drop rate") {
  benchmark_loads(*this, name);

  spdlog::info("Elements dropped because of full buckets (%):");
  summarize(index_formatter, multiply_formatter(100));
}

/********
 * Main *
 ********/
BENCHMARK_MAIN {
  // Change "info" to "debug" to see more detailed logs
  spdlog::set_level(spdlog::level::info);

  return 0;
}
