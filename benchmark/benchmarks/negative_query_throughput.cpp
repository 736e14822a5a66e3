#include <cstddef>
#include <cstdint>
#include <vector>

#include "benchmark_utils.hpp"

template <uint16_t SLOTS, uint8_t BITS>
auto negative_query_throughput(const std::vector<uint64_t> &nums, const size_t n) -> double {
  auto table = make_table<SLOTS, BITS>();
  std::vector<bool> stored;
  fill_table(table, nums, n, stored);

  // Keep the result alive so the loop is not optimized away
  volatile size_t found = 0;
  const double start = get_current_time_in_seconds();
  for (size_t i = n; i < 2 * n; i++)
    if (table.lookup(nums[i]))
      found = found + 1;
  const double end = get_current_time_in_seconds();

  return end - start;
}

REGISTER_BENCHMARK_TASK(QHT_S1F8) { return negative_query_throughput<1, 8>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S4F8) { return negative_query_throughput<4, 8>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S5F3) { return negative_query_throughput<5, 3>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S8F3) { return negative_query_throughput<8, 3>(nums, n); }

BENCHMARK_TASK_MAIN
