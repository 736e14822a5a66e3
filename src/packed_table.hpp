#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "utils/bits.hpp"

namespace qht {

/**
 * @brief A fixed-size array of buckets, each holding `slots_per_bucket` fingerprint slots, packed
 * back to back into 64-bit words.
 *
 * Every slot is `bits_per_fingerprint + 1` bits wide: the lowest bit is the occupied flag and the
 * fingerprint sits above it, i.e. a raw slot is `(fingerprint << 1) | 1` once written and `0`
 * while empty. Zero is therefore a legal fingerprint.
 *
 * The storage is sized once at construction and never reallocated. Bucket and slot indices are
 * not checked outside debug builds.
 */
class PackedTable {
public:
  static constexpr size_t BITS_PER_WORD = 64UZ;

private:
  size_t num_buckets_;
  size_t slots_per_bucket_;
  size_t bits_per_fingerprint_;
  size_t bits_per_slot_;

  std::vector<uint64_t> words_;

  [[nodiscard]] auto slot_offset(const size_t bucket, const size_t slot) const -> size_t {
    assert(bucket < num_buckets_);
    assert(slot < slots_per_bucket_);
    return (bucket * slots_per_bucket_ + slot) * bits_per_slot_;
  }

  /**
   * @brief Read `length` bits starting at bit `from`. The range may straddle two words.
   *
   * @param from Absolute bit offset.
   * @param length Number of bits (1 to 64).
   * @return The bits, right-aligned.
   */
  [[nodiscard]] auto read_bits(const size_t from, const size_t length) const -> uint64_t {
    const size_t word = from / BITS_PER_WORD;
    const size_t bit = from % BITS_PER_WORD;

    uint64_t buffer = words_[word] >> bit;
    if (bit + length > BITS_PER_WORD)
      buffer |= words_[word + 1] << (BITS_PER_WORD - bit);

    return buffer & lower_bits_mask_64(length);
  }

  /**
   * @brief Write the low `length` bits of `bits` starting at bit `from`, leaving every other bit
   * untouched. The range may straddle two words.
   *
   * @param from Absolute bit offset.
   * @param length Number of bits (1 to 64).
   * @param bits The value to write. Bits above `length` are ignored.
   */
  void write_bits(const size_t from, const size_t length, uint64_t bits) {
    const size_t word = from / BITS_PER_WORD;
    const size_t bit = from % BITS_PER_WORD;
    const uint64_t mask = lower_bits_mask_64(length);
    bits &= mask;

    words_[word] = (words_[word] & ~(mask << bit)) | (bits << bit);

    if (bit + length > BITS_PER_WORD) {
      const size_t written = BITS_PER_WORD - bit;
      const uint64_t high_mask = mask >> written;
      words_[word + 1] = (words_[word + 1] & ~high_mask) | (bits >> written);
    }
  }

  [[nodiscard]] auto read_raw_slot(const size_t bucket, const size_t slot) const -> uint64_t {
    return read_bits(slot_offset(bucket, slot), bits_per_slot_);
  }

  [[nodiscard]] static constexpr auto occupied_slot(const uint64_t fingerprint) -> uint64_t {
    return (fingerprint << 1) | 1;
  }

public:
  /**
   * @brief Create a zeroed table. Parameters are expected to be validated by the caller: all
   * positive, `bits_per_fingerprint` below 64 and the total bit count representable.
   *
   * @param num_buckets Bucket count.
   * @param slots_per_bucket Slots per bucket.
   * @param bits_per_fingerprint Bits per fingerprint, excluding the occupied flag.
   */
  PackedTable(const size_t num_buckets, const size_t slots_per_bucket,
              const size_t bits_per_fingerprint)
      : num_buckets_(num_buckets), slots_per_bucket_(slots_per_bucket),
        bits_per_fingerprint_(bits_per_fingerprint), bits_per_slot_(bits_per_fingerprint + 1),
        words_(words_for_bits(num_buckets * slots_per_bucket * (bits_per_fingerprint + 1)), 0) {
    assert(bits_per_slot_ <= BITS_PER_WORD);
  }

  // Words needed to hold `bits` bits, without wrapping near the top of the range
  [[nodiscard]] static constexpr auto words_for_bits(const size_t bits) -> size_t {
    return bits / BITS_PER_WORD + (bits % BITS_PER_WORD != 0 ? 1 : 0);
  }

  [[nodiscard]] auto num_buckets() const -> size_t { return num_buckets_; }
  [[nodiscard]] auto slots_per_bucket() const -> size_t { return slots_per_bucket_; }
  [[nodiscard]] auto bits_per_fingerprint() const -> size_t { return bits_per_fingerprint_; }
  [[nodiscard]] auto bits_per_slot() const -> size_t { return bits_per_slot_; }

  // Exact number of bits used by the slots, excluding padding of the last word
  [[nodiscard]] auto size_in_bits() const -> size_t {
    return num_buckets_ * slots_per_bucket_ * bits_per_slot_;
  }

  /**
   * @brief Read the fingerprint stored in a bucket slot. An empty slot reads as 0; use
   * `is_occupied` to tell it apart from a stored 0.
   *
   * @param bucket The index of the bucket.
   * @param slot The index of the slot in the bucket.
   * @return The fingerprint.
   */
  [[nodiscard]] auto read_slot(const size_t bucket, const size_t slot) const -> uint64_t {
    return read_raw_slot(bucket, slot) >> 1;
  }

  [[nodiscard]] auto is_occupied(const size_t bucket, const size_t slot) const -> bool {
    return (read_raw_slot(bucket, slot) & 1) != 0;
  }

  /**
   * @brief Write a fingerprint to a bucket slot and mark the slot occupied.
   *
   * The fingerprint must fit in `bits_per_fingerprint` bits.
   *
   * @param bucket The index of the bucket.
   * @param slot The index of the slot in the bucket.
   * @param fingerprint The fingerprint to write.
   */
  void write_slot(const size_t bucket, const size_t slot, const uint64_t fingerprint) {
    assert((fingerprint & ~lower_bits_mask_64(bits_per_fingerprint_)) == 0);
    write_bits(slot_offset(bucket, slot), bits_per_slot_, occupied_slot(fingerprint));
  }

  /**
   * @brief Find if the fingerprint exists in any occupied slot of the bucket.
   *
   * @param bucket The index of the bucket.
   * @param fingerprint The fingerprint to find.
   * @return True if an occupied slot holds the fingerprint.
   */
  [[nodiscard]] auto find_fingerprint_in_bucket(const size_t bucket,
                                                const uint64_t fingerprint) const -> bool {
    const uint64_t wanted = occupied_slot(fingerprint);
    for (size_t slot = 0; slot < slots_per_bucket_; slot++)
      if (read_raw_slot(bucket, slot) == wanted)
        return true;
    return false;
  }

  /**
   * @brief Insert the fingerprint into the first empty slot of the bucket (slot 0 first). Nothing
   * is written if the bucket is full.
   *
   * @param bucket The index of the bucket.
   * @param fingerprint The fingerprint to insert.
   * @return True if the fingerprint is inserted, false if the bucket is full.
   */
  auto insert_fingerprint_to_bucket(const size_t bucket, const uint64_t fingerprint) -> bool {
    for (size_t slot = 0; slot < slots_per_bucket_; slot++)
      if (read_raw_slot(bucket, slot) == 0) {
        write_slot(bucket, slot, fingerprint);
        return true;
      }
    return false;
  }

  /**
   * @brief Count the number of occupied slots in a bucket.
   *
   * @param bucket The index of the bucket.
   * @return The number of fingerprints in the bucket.
   */
  [[nodiscard]] auto count_fingerprints_in_bucket(const size_t bucket) const -> size_t {
    size_t count = 0;
    for (size_t slot = 0; slot < slots_per_bucket_; slot++)
      if ((read_raw_slot(bucket, slot) & 1) != 0)
        count++;
    return count;
  }
};

} // namespace qht
