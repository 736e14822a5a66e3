#pragma once

#include <algorithm>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

#include "predefine.hpp"
#include "utils/bits.hpp"
#include "utils/hash.hpp"

namespace qht {

/**
 * @brief Maps an element to a bucket index and a fingerprint.
 *
 * The element is hashed once with the seed given at construction. The bucket index is the hash
 * modulo the bucket count (a mask when the count is a power of two) and the fingerprint is taken
 * from the quotient, the bits the index did not consume. When the quotient has fewer bits than
 * the fingerprint needs, the fingerprint comes from a second hash pass over the first hash
 * instead, so index and fingerprint never share bits.
 */
class Splitter {
  size_t bucket_count_;
  uint64_t seed_;

  bool power_of_2_buckets_;
  size_t index_bits_;
  uint64_t fingerprint_mask_;
  bool needs_second_pass_;

  [[nodiscard]] auto bucket_of(const uint64_t hash) const -> size_t {
    if (power_of_2_buckets_)
      return hash & (bucket_count_ - 1);
    return hash % bucket_count_;
  }

  [[nodiscard]] auto fingerprint_of(const uint64_t hash) const -> uint64_t {
    if (needs_second_pass_)
      return rehash_64(hash, seed_ ^ FINGERPRINT_SEED_SALT) & fingerprint_mask_;
    const uint64_t quotient = power_of_2_buckets_ ? hash >> index_bits_ : hash / bucket_count_;
    return quotient & fingerprint_mask_;
  }

public:
  /**
   * @brief Create a splitter. Parameters are expected to be validated by the caller.
   *
   * @param bucket_count Number of buckets (positive).
   * @param fingerprint_bits Bits per fingerprint (1 to `MAX_FINGERPRINT_BITS`).
   * @param seed Hash seed.
   */
  Splitter(const size_t bucket_count, const size_t fingerprint_bits, const uint64_t seed)
      : bucket_count_(bucket_count), seed_(seed),
        power_of_2_buckets_(is_power_of_2(bucket_count)), index_bits_(ceil_log2(bucket_count)),
        fingerprint_mask_(lower_bits_mask_64(fingerprint_bits)),
        needs_second_pass_(fingerprint_bits > HASH_BITS - index_bits_) {}

  [[nodiscard]] auto seed() const -> uint64_t { return seed_; }

  // Byte count passed to the hash, capped at `INT_MAX`
  [[nodiscard]] static constexpr auto hashed_length(const size_t length) -> int {
    return static_cast<int>(std::min(length, static_cast<size_t>(INT_MAX)));
  }

  // Whether fingerprints come from a second hash pass
  [[nodiscard]] auto uses_second_pass() const -> bool { return needs_second_pass_; }

  /**
   * @brief Hash an item with a seed. Strings are hashed by their bytes; only the first
   * `INT_MAX` bytes of longer strings are hashed, as the hash takes an `int` length.
   *
   * @param item The item to hash.
   * @param seed The seed.
   * @return The 64-bit hash.
   */
  template <typename T>
  [[nodiscard]] static auto hash(const T &item, const uint64_t seed) -> uint64_t {
    if constexpr (std::is_integral_v<T> || std::is_enum_v<T>)
      return murmur_hash2_x64_a(&item, sizeof(T), seed);
    else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::string_view>)
      return murmur_hash2_x64_a(item.data(), hashed_length(item.size()), seed);
    else if constexpr (std::is_same_v<std::decay_t<T>, const char *> ||
                       std::is_same_v<std::decay_t<T>, char *>)
      return murmur_hash2_x64_a(item, hashed_length(std::strlen(item)), seed);
    else
      return rehash_64(static_cast<uint64_t>(std::hash<T>{}(item)), seed);
  }

  /**
   * @brief Generate the bucket index and fingerprint for a given item.
   *
   * @param item The item to split.
   * @param bucket_idx The generated bucket index, in [0, bucket_count).
   * @param fingerprint The generated fingerprint, in [0, 2^fingerprint_bits).
   */
  template <typename T>
  void split(const T &item, size_t *bucket_idx, uint64_t *fingerprint) const {
    split_hash(hash(item, seed_), bucket_idx, fingerprint);
  }

  /**
   * @brief Split an already computed hash. Exposed for callers that hash elements themselves.
   *
   * @param full_hash The hash to split.
   * @param bucket_idx The generated bucket index.
   * @param fingerprint The generated fingerprint.
   */
  void split_hash(const uint64_t full_hash, size_t *bucket_idx, uint64_t *fingerprint) const {
    *bucket_idx = bucket_of(full_hash);
    *fingerprint = fingerprint_of(full_hash);
  }
};

} // namespace qht
