#include <cstddef>
#include <cstdint>
#include <vector>

#include "benchmark_utils.hpp"

// Share of the inserted elements that were dropped because their bucket was full
template <uint16_t SLOTS, uint8_t BITS>
auto drop_rate(const std::vector<uint64_t> &nums, const size_t n) -> double {
  auto table = make_table<SLOTS, BITS>();
  std::vector<bool> stored;
  fill_table(table, nums, n, stored);

  return static_cast<double>(n - table.size()) / static_cast<double>(n);
}

REGISTER_BENCHMARK_TASK(QHT_S1F8) { return drop_rate<1, 8>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S4F8) { return drop_rate<4, 8>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S5F3) { return drop_rate<5, 3>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S8F3) { return drop_rate<8, 3>(nums, n); }

BENCHMARK_TASK_MAIN
