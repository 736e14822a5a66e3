#include <cstddef>
#include <cstdint>
#include <vector>

#include "benchmark_utils.hpp"

template <uint16_t SLOTS, uint8_t BITS>
auto false_positive_rate(const std::vector<uint64_t> &nums, const size_t n) -> double {
  auto table = make_table<SLOTS, BITS>();
  std::vector<bool> stored;
  fill_table(table, nums, n, stored);
  check_no_false_negative(table, nums, stored);

  size_t false_positive = 0;
  for (size_t i = n; i < 2 * n; i++)
    if (table.lookup(nums[i]))
      false_positive++;

  return static_cast<double>(false_positive) / static_cast<double>(n);
}

REGISTER_BENCHMARK_TASK(QHT_S1F8) { return false_positive_rate<1, 8>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S4F8) { return false_positive_rate<4, 8>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S5F3) { return false_positive_rate<5, 3>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S8F3) { return false_positive_rate<8, 3>(nums, n); }

BENCHMARK_TASK_MAIN
