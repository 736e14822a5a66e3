#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <iterator>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fplus/fplus.hpp>

#include "../../src/QHT.hpp"

inline size_t bucket_count_log2;
inline size_t bucket_count;

inline std::vector<std::string> benchmark_task_names;
inline std::vector<std::function<double(const std::vector<uint64_t> &, size_t)>>
    benchmark_task_functions;

// A task receives 2n random elements: the first n are inserted, the last n are never inserted
// and serve as negative queries. It prints one number, the measured value.
#define REGISTER_BENCHMARK_TASK(name)                                                              \
  auto benchmark_task_##name(const std::vector<uint64_t> &nums, size_t n)->double;                 \
  static bool _benchmark_task_##name##_registered = [] {                                           \
    benchmark_task_names.emplace_back(#name);                                                      \
    benchmark_task_functions.emplace_back(benchmark_task_##name);                                  \
    return true;                                                                                   \
  }();                                                                                             \
  auto benchmark_task_##name(const std::vector<uint64_t> &nums, size_t n)->double

inline auto get_current_time_in_seconds() -> double {
  const auto now = std::chrono::high_resolution_clock::now();
  const auto duration = now.time_since_epoch();
  return std::chrono::duration_cast<std::chrono::duration<double>>(duration).count();
}

inline void random_gen(std::vector<uint64_t> &nums) {
  std::mt19937_64 gen(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dis(0, std::numeric_limits<uint64_t>::max());
  for (uint64_t &num : nums)
    num = dis(gen);
}

/**
 * @brief Create the table measured by a task.
 *
 * @tparam SLOTS Slots per bucket.
 * @tparam BITS Bits per fingerprint.
 * @return A table with `bucket_count` buckets and a random seed.
 */
template <uint16_t SLOTS, uint8_t BITS> auto make_table() -> qht::QuotientTable<uint64_t> {
  return {bucket_count, SLOTS, BITS, qht::QuotientTable<uint64_t>::generate_hash_seed()};
}

/**
 * @brief Fill a table with the first n elements, the way every task prepares its table.
 *
 * @param table The table to fill.
 * @param nums The elements.
 * @param n Number of elements to insert.
 * @param stored Set to whether each element was stored.
 */
inline void fill_table(qht::QuotientTable<uint64_t> &table, const std::vector<uint64_t> &nums,
                       const size_t n, std::vector<bool> &stored) {
  stored.assign(n, false);
  for (size_t i = 0; i < n; i++)
    stored[i] = table.insert(nums[i]);
}

/**
 * @brief Make sure no false negative happens: every stored element must be found.
 */
inline void check_no_false_negative(const qht::QuotientTable<uint64_t> &table,
                                    const std::vector<uint64_t> &nums,
                                    const std::vector<bool> &stored) {
  for (size_t i = 0; i < stored.size(); i++)
    if (stored[i] && !table.lookup(nums[i]))
      throw std::runtime_error(
          fmt::format("Query failed (false negative): Unable to find element {} at index {}/{}",
                      nums[i], i, stored.size() - 1));
}

inline auto benchmark_task_main(int argc, char **argv) -> int {
  if (argc < 4) {
    std::cerr << "Usage: " << argv[0] << " {" << fplus::join_elem('|', benchmark_task_names)
              << "} <bucket_count_log2> <element_count>" << std::endl;
    return 1;
  }

  try {
    const std::string name = argv[1];

    const auto it = std::ranges::find(benchmark_task_names, name);
    if (it == benchmark_task_names.end()) {
      std::cerr << "Unknown benchmark name: " << name << std::endl;
      return 1;
    }

    bucket_count_log2 = std::stoul(argv[2]);
    bucket_count = 1UZ << bucket_count_log2;

    const size_t n = std::stoul(argv[3]);
    std::vector<uint64_t> nums(n * 2);
    random_gen(nums);

    const size_t index = std::distance(benchmark_task_names.begin(), it);
    std::cout << benchmark_task_functions[index](nums, n) << std::endl;
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}

#define BENCHMARK_TASK_MAIN                                                                        \
  int main(int argc, char **argv) { return benchmark_task_main(argc, argv); }
