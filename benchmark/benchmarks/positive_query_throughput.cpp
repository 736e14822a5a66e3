#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>

#include "benchmark_utils.hpp"

// Returns Mops over the stored elements, since dropped elements are not positives
template <uint16_t SLOTS, uint8_t BITS>
auto positive_query_throughput(const std::vector<uint64_t> &nums, const size_t n) -> double {
  auto table = make_table<SLOTS, BITS>();
  std::vector<bool> stored;
  fill_table(table, nums, n, stored);

  // Only stored elements are guaranteed positives
  std::vector<uint64_t> positives;
  positives.reserve(n);
  for (size_t i = 0; i < n; i++)
    if (stored[i])
      positives.push_back(nums[i]);
  if (positives.empty())
    throw std::runtime_error("No element was stored, nothing to query");

  size_t found = 0;
  const double start = get_current_time_in_seconds();
  for (const uint64_t item : positives)
    if (table.lookup(item))
      found++;
  const double end = get_current_time_in_seconds();

  if (found != positives.size())
    throw std::runtime_error(fmt::format("Query failed (false negative): found {} of {} elements",
                                         found, positives.size()));

  return static_cast<double>(positives.size()) / (end - start) / 1'000'000.0;
}

REGISTER_BENCHMARK_TASK(QHT_S1F8) { return positive_query_throughput<1, 8>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S4F8) { return positive_query_throughput<4, 8>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S5F3) { return positive_query_throughput<5, 3>(nums, n); }
REGISTER_BENCHMARK_TASK(QHT_S8F3) { return positive_query_throughput<8, 3>(nums, n); }

BENCHMARK_TASK_MAIN
