#pragma once

#include <cstddef>
#include <cstdint>

namespace qht {

/**
 * @brief Check whether x is a power of two.
 *
 * @param x The number to check.
 * @return True if x is a power of two (0 is not).
 */
constexpr auto is_power_of_2(const uint64_t x) -> bool { return x != 0 && (x & (x - 1)) == 0; }

/**
 * @brief Number of bits needed to address x distinct values, i.e. ceil(log2(x)).
 *
 * @param x A positive number.
 * @return ceil(log2(x)), with ceil_log2(1) == 0.
 */
constexpr auto ceil_log2(const uint64_t x) -> size_t {
  if (x <= 1)
    return 0;
  return 64 - static_cast<size_t>(__builtin_clzll(x - 1));
}

/**
 * @brief Generate a bitmask with the n least significant bits set to 1.
 *
 * Warning: `n` must not be greater than 64.
 *
 * @param n A number between 0 and 64 (inclusive).
 * @return A bitmask with the n least significant bits set to 1.
 */
constexpr auto lower_bits_mask_64(const size_t n) -> uint64_t {
  if (n == 0)
    return 0;
  // Avoid overflow
  if (n == 64)
    return ~static_cast<uint64_t>(0);
  return (static_cast<uint64_t>(1) << n) - 1;
}

} // namespace qht
