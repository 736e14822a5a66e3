#include <cstddef>
#include <cstdint>
#include <vector>

#include "benchmark_utils.hpp"

// Allocating and zeroing the table, the cost of a reset in a streaming setting
template <uint16_t SLOTS, uint8_t BITS>
auto construction_time(const std::vector<uint64_t> &nums, const size_t /* n */) -> double {
  const double start = get_current_time_in_seconds();
  auto table = make_table<SLOTS, BITS>();
  const double end = get_current_time_in_seconds();

  // Touch the table so its construction cannot be elided
  if (table.lookup(nums[0]))
    return -1.0;

  return end - start;
}

REGISTER_BENCHMARK_TASK(QHT_S1F8) { return construction_time<1, 8>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S4F8) { return construction_time<4, 8>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S5F3) { return construction_time<5, 3>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S8F3) { return construction_time<8, 3>(nums, n); }

BENCHMARK_TASK_MAIN
