#include <cstddef>
#include <cstdint>
#include <vector>

#include "benchmark_utils.hpp"

template <uint16_t SLOTS, uint8_t BITS>
auto insertion_throughput(const std::vector<uint64_t> &nums, const size_t n) -> double {
  auto table = make_table<SLOTS, BITS>();
  std::vector<bool> stored(n);

  // Test insertion
  const double start = get_current_time_in_seconds();
  for (size_t i = 0; i < n; i++)
    stored[i] = table.insert(nums[i]);
  const double end = get_current_time_in_seconds();

  check_no_false_negative(table, nums, stored);

  return end - start;
}

REGISTER_BENCHMARK_TASK(QHT_S1F8) { return insertion_throughput<1, 8>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S4F8) { return insertion_throughput<4, 8>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S5F3) { return insertion_throughput<5, 3>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S8F3) { return insertion_throughput<8, 3>(nums, n); }

BENCHMARK_TASK_MAIN
