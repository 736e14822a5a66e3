#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "packed_table.hpp"
#include "predefine.hpp"
#include "splitter.hpp"

namespace qht {

// Outcome of `QuotientTable::lookup_and_insert`
enum class Status : std::uint8_t {
  // The element was already present (or collides with a present fingerprint)
  Found = 0,
  // The element was absent and has been stored
  Inserted = 1,
  // The element was absent and its bucket is full, so it was dropped
  BucketFull = 2,
};

[[nodiscard]] constexpr auto stringify_status(const Status status) -> const char * {
  return status == Status::Found      ? "Found"
         : status == Status::Inserted ? "Inserted"
                                      : "BucketFull";
}

/**
 * @brief False positive rate of a lookup probing a full bucket, `1 - (1 - 2^-F)^S`.
 *
 * @param slots_per_bucket Slots per bucket (S).
 * @param fingerprint_bits Bits per fingerprint (F).
 * @return The probability that a foreign fingerprint matches one of the S stored ones.
 */
[[nodiscard]] inline auto expected_false_positive_rate(const size_t slots_per_bucket,
                                                       const size_t fingerprint_bits) -> double {
  const double miss = 1.0 - std::ldexp(1.0, -static_cast<int>(fingerprint_bits));
  return 1.0 - std::pow(miss, static_cast<double>(slots_per_bucket));
}

// A quotient hash table answers "have I seen this element before?" in fixed memory, with false
// positives but no false negatives for elements it managed to store. It takes one template
// parameter:
//   T: the type of item you want to insert
template <typename T> class QuotientTable {
  PackedTable table_;
  Splitter splitter_;

  // Number of occupied slots
  size_t num_items_ = 0;

  /**
   * @brief Validate the bucket shape and return the bits one bucket takes. Shared by the
   * constructor and `with_memory_budget`, which divides by the result.
   */
  [[nodiscard]] static auto bits_per_bucket(const uint16_t slots_per_bucket,
                                            const uint8_t fingerprint_bits) -> uint64_t {
    if (slots_per_bucket == 0)
      throw std::invalid_argument("QuotientTable: slots_per_bucket must be positive");
    if (fingerprint_bits == 0)
      throw std::invalid_argument("QuotientTable: fingerprint_bits must be positive");
    if (fingerprint_bits > MAX_FINGERPRINT_BITS)
      throw std::invalid_argument(
          fmt::format("QuotientTable: fingerprint_bits is {}, but at most {} bits can be carved "
                      "out of a {}-bit hash",
                      fingerprint_bits, MAX_FINGERPRINT_BITS, HASH_BITS));
    return static_cast<uint64_t>(slots_per_bucket) * (static_cast<uint64_t>(fingerprint_bits) + 1);
  }

  /**
   * @brief Validate the construction parameters and allocate the table. Misconfiguration is a
   * programming error and throws before any storage is allocated.
   */
  [[nodiscard]] static auto make_table(const uint64_t bucket_count,
                                       const uint16_t slots_per_bucket,
                                       const uint8_t fingerprint_bits) -> PackedTable {
    if (bucket_count == 0)
      throw std::invalid_argument("QuotientTable: bucket_count must be positive");
    const uint64_t bucket_bits = bits_per_bucket(slots_per_bucket, fingerprint_bits);

    // The bit count plus the padding of the last word must stay representable
    constexpr uint64_t MAX_TOTAL_BITS =
        std::numeric_limits<uint64_t>::max() - (PackedTable::BITS_PER_WORD - 1);
    if (bucket_count > MAX_TOTAL_BITS / bucket_bits)
      throw std::invalid_argument(
          fmt::format("QuotientTable: {} buckets of {} bits do not fit in a 64-bit bit count",
                      bucket_count, bucket_bits));

    return {bucket_count, slots_per_bucket, fingerprint_bits};
  }

public:
  /**
   * @brief Create a new quotient hash table. All slots start empty.
   *
   * @param bucket_count Number of buckets. Need not be a power of 2.
   * @param slots_per_bucket Number of fingerprint slots per bucket.
   * @param fingerprint_bits Bits per fingerprint, 1 to `MAX_FINGERPRINT_BITS`. Each slot takes one
   * more bit for its occupied flag.
   * @param seed Hash seed. Tables with equal parameters and seed behave identically.
   * @throws std::invalid_argument If a parameter is zero or out of range.
   */
  QuotientTable(const uint64_t bucket_count, const uint16_t slots_per_bucket,
                const uint8_t fingerprint_bits, const uint64_t seed = DEFAULT_HASH_SEED)
      : table_(make_table(bucket_count, slots_per_bucket, fingerprint_bits)),
        splitter_(bucket_count, fingerprint_bits, seed) {
    spdlog::debug("QuotientTable created: {} buckets x {} slots x {}+1 bits ({} bits), seed {}{}",
                  bucket_count, slots_per_bucket, fingerprint_bits, table_.size_in_bits(), seed,
                  splitter_.uses_second_pass() ? ", second-pass fingerprints" : "");
  }

  /**
   * @brief Create a table sized to a memory budget: as many buckets as fit in `memory_bits`.
   *
   * @param memory_bits Memory budget in bits.
   * @param slots_per_bucket Number of fingerprint slots per bucket.
   * @param fingerprint_bits Bits per fingerprint.
   * @param seed Hash seed.
   * @throws std::invalid_argument If the budget cannot hold a single bucket, or a parameter is
   * invalid.
   */
  [[nodiscard]] static auto with_memory_budget(const uint64_t memory_bits,
                                               const uint16_t slots_per_bucket,
                                               const uint8_t fingerprint_bits,
                                               const uint64_t seed = DEFAULT_HASH_SEED)
      -> QuotientTable {
    const uint64_t bucket_bits = bits_per_bucket(slots_per_bucket, fingerprint_bits);
    const uint64_t bucket_count = memory_bits / bucket_bits;
    if (bucket_count == 0)
      throw std::invalid_argument(
          fmt::format("QuotientTable: a memory budget of {} bits cannot hold one bucket of {} bits",
                      memory_bits, bucket_bits));
    return {bucket_count, slots_per_bucket, fingerprint_bits, seed};
  }

  /**
   * @brief Generate a random seed for hash functions.
   *
   * @return The generated seed.
   */
  [[nodiscard]] static auto generate_hash_seed() -> uint64_t {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis(0, std::numeric_limits<uint64_t>::max());
    return dis(gen);
  }

  /**
   * @brief Insert an item into the first empty slot of its bucket. Whether the item is already
   * present is not checked, so inserting it twice takes two slots; use `lookup_and_insert` to
   * skip known items.
   *
   * @param item The item to insert.
   * @return True if the item is stored, false if its bucket is full (the item is dropped and the
   * table is unchanged).
   */
  auto insert(const T &item) -> bool {
    size_t bucket_idx;
    uint64_t fingerprint;
    splitter_.split(item, &bucket_idx, &fingerprint);

    if (!table_.insert_fingerprint_to_bucket(bucket_idx, fingerprint))
      return false;
    num_items_++;
    return true;
  }

  /**
   * @brief Query if an item is in the table, with false positive rate.
   *
   * @param item The item to query.
   * @return True if the item's fingerprint is stored in its bucket.
   */
  [[nodiscard]] auto lookup(const T &item) const -> bool {
    size_t bucket_idx;
    uint64_t fingerprint;
    splitter_.split(item, &bucket_idx, &fingerprint);

    return table_.find_fingerprint_in_bucket(bucket_idx, fingerprint);
  }

  /**
   * @brief Query an item and insert it if it is not found. This is the duplicate detection step
   * of a stream filter.
   *
   * @param item The item to look up and insert.
   * @return `Found` if the item was present, `Inserted` if it has been stored, `BucketFull` if it
   * was absent and could not be stored.
   */
  auto lookup_and_insert(const T &item) -> Status {
    size_t bucket_idx;
    uint64_t fingerprint;
    splitter_.split(item, &bucket_idx, &fingerprint);

    if (table_.find_fingerprint_in_bucket(bucket_idx, fingerprint))
      return Status::Found;
    if (!table_.insert_fingerprint_to_bucket(bucket_idx, fingerprint))
      return Status::BucketFull;
    num_items_++;
    return Status::Inserted;
  }

  [[nodiscard]] auto bucket_count() const -> uint64_t { return table_.num_buckets(); }
  [[nodiscard]] auto slots_per_bucket() const -> uint16_t {
    return static_cast<uint16_t>(table_.slots_per_bucket());
  }
  [[nodiscard]] auto fingerprint_bits() const -> uint8_t {
    return static_cast<uint8_t>(table_.bits_per_fingerprint());
  }
  [[nodiscard]] auto seed() const -> uint64_t { return splitter_.seed(); }

  // Number of occupied slots
  [[nodiscard]] auto size() const -> size_t { return num_items_; }
  // Total number of slots
  [[nodiscard]] auto capacity() const -> size_t {
    return table_.num_buckets() * table_.slots_per_bucket();
  }
  [[nodiscard]] auto load_factor() const -> double {
    return static_cast<double>(num_items_) / static_cast<double>(capacity());
  }
  [[nodiscard]] auto size_in_bits() const -> size_t { return table_.size_in_bits(); }

  /**
   * @brief Count the occupied slots of a bucket.
   *
   * @param bucket The index of the bucket, below `bucket_count()`.
   * @return The number of occupied slots.
   * @throws std::out_of_range If the bucket does not exist.
   */
  [[nodiscard]] auto count_in_bucket(const uint64_t bucket) const -> size_t {
    if (bucket >= table_.num_buckets())
      throw std::out_of_range(fmt::format("QuotientTable: bucket {} out of range [0, {})", bucket,
                                          table_.num_buckets()));
    return table_.count_fingerprints_in_bucket(bucket);
  }

  /**
   * @brief The bucket an item maps to. Useful to reason about collisions.
   *
   * @param item The item.
   * @return The bucket index.
   */
  [[nodiscard]] auto bucket_of(const T &item) const -> uint64_t {
    size_t bucket_idx;
    uint64_t fingerprint;
    splitter_.split(item, &bucket_idx, &fingerprint);
    return bucket_idx;
  }
};

} // namespace qht
