#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "../src/QHT.hpp"

using qht::QuotientTable;
using qht::Status;

constexpr size_t INSERT_NUM = 100'000;

// generate the integers
inline void random_gen(size_t n, uint64_t *store) {
  std::mt19937 rd(12821);
  const auto rand_range = static_cast<uint64_t>(std::pow(2, 64) / static_cast<double>(n));
  for (size_t i = 0; i < n; i++) {
    uint64_t rand = rand_range * i + rd() % rand_range;
    store[i] = rand;
  }
}

TEST_CASE("QuotientTable should reject invalid parameters", "[quotienttable]") {
  REQUIRE_THROWS_AS(QuotientTable<uint64_t>(0, 8, 3), std::invalid_argument);
  REQUIRE_THROWS_AS(QuotientTable<uint64_t>(1024, 0, 3), std::invalid_argument);
  REQUIRE_THROWS_AS(QuotientTable<uint64_t>(1024, 8, 0), std::invalid_argument);
  REQUIRE_THROWS_AS(QuotientTable<uint64_t>(1024, 8, 64), std::invalid_argument);
  REQUIRE_THROWS_AS(QuotientTable<uint64_t>(std::numeric_limits<uint64_t>::max(), 1024, 63),
                    std::invalid_argument);
  REQUIRE_NOTHROW(QuotientTable<uint64_t>(1, 1, 63));

  SECTION("Bit counts too close to 2^64 for the last word's padding") {
    REQUIRE_THROWS_AS(QuotientTable<uint64_t>(std::numeric_limits<uint64_t>::max() / 2, 1, 1),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(QuotientTable<uint64_t>(std::numeric_limits<uint64_t>::max() / 4, 2, 1),
                      std::invalid_argument);
  }

  REQUIRE_THROWS_AS(QuotientTable<uint64_t>::with_memory_budget(31, 8, 3), std::invalid_argument);
  REQUIRE_THROWS_AS(QuotientTable<uint64_t>::with_memory_budget(1024, 0, 3),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(QuotientTable<uint64_t>::with_memory_budget(1024, 8, 0),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(QuotientTable<uint64_t>::with_memory_budget(1 << 20, 8, 64),
                    std::invalid_argument);
}

TEST_CASE("QuotientTable should report its geometry", "[quotienttable]") {
  const QuotientTable<uint64_t> table(1000, 5, 3, 77);
  REQUIRE(table.bucket_count() == 1000);
  REQUIRE(table.slots_per_bucket() == 5);
  REQUIRE(table.fingerprint_bits() == 3);
  REQUIRE(table.seed() == 77);
  REQUIRE(table.capacity() == 5000);
  REQUIRE(table.size() == 0);
  REQUIRE(table.size_in_bits() == 1000 * 5 * (3 + 1));
  REQUIRE_THROWS_AS(table.count_in_bucket(1000), std::out_of_range);

  SECTION("Sizing from a memory budget") {
    const auto budgeted = QuotientTable<uint64_t>::with_memory_budget(100'000, 5, 3);
    REQUIRE(budgeted.bucket_count() == 100'000 / (5 * 4));
    REQUIRE(budgeted.size_in_bits() <= 100'000);
  }
}

TEST_CASE("QuotientTable should find the element it was given", "[quotienttable]") {
  QuotientTable<uint64_t> table(1024, 8, 3);

  REQUIRE_FALSE(table.lookup(42));
  REQUIRE(table.insert(42));
  REQUIRE(table.lookup(42));
  REQUIRE(table.size() == 1);

  // 43 can only be a false positive if it shares the bucket of 42
  if (table.bucket_of(43) != table.bucket_of(42))
    REQUIRE_FALSE(table.lookup(43));

  // Same seed, same answers across instances (and runs)
  QuotientTable<uint64_t> other(1024, 8, 3);
  REQUIRE(other.insert(42));
  REQUIRE(other.lookup(43) == table.lookup(43));
}

TEST_CASE("QuotientTable should perform insertions/lookups without false negatives",
          "[quotienttable]") {
  constexpr size_t GENERATE_NUM = INSERT_NUM * 2;
  std::vector<uint64_t> nums(GENERATE_NUM);
  random_gen(GENERATE_NUM, nums.data());

  // Capacity 2^15 * 4 = 131072 slots for 100000 elements
  QuotientTable<uint64_t> table(1 << 15, 4, 12);
  std::vector<bool> stored(INSERT_NUM);
  size_t stored_count = 0;
  for (size_t i = 0; i < INSERT_NUM; i++) {
    stored[i] = table.insert(nums[i]);
    if (stored[i])
      stored_count++;
  }
  REQUIRE(table.size() == stored_count);
  REQUIRE(stored_count > INSERT_NUM * 8 / 10);

  SECTION("No false negative should be found after insertion") {
    for (size_t i = 0; i < INSERT_NUM; i++)
      if (stored[i])
        REQUIRE(table.lookup(nums[i]));
  }

  SECTION("Lookups should be idempotent") {
    for (size_t i = 0; i < GENERATE_NUM; i += 97) {
      const bool first = table.lookup(nums[i]);
      for (int repeat = 0; repeat < 3; repeat++)
        REQUIRE(table.lookup(nums[i]) == first);
    }
    REQUIRE(table.size() == stored_count);
  }

  SECTION("Should have some false positive, but not more than a full bucket allows") {
    size_t false_positive = 0;
    for (size_t i = 0; i < INSERT_NUM; i++)
      if (table.lookup(nums[INSERT_NUM + i]))
        false_positive++;
    REQUIRE(false_positive > 0);
    REQUIRE(static_cast<double>(false_positive) / static_cast<double>(INSERT_NUM) <
            qht::expected_false_positive_rate(4, 12));
  }
}

TEST_CASE("QuotientTable false positive rate should match the full bucket bound",
          "[quotienttable]") {
  constexpr uint64_t BUCKETS = 1024;
  constexpr uint16_t SLOTS = 4;
  constexpr uint8_t BITS = 8;
  constexpr size_t QUERY_NUM = 200'000;

  QuotientTable<uint64_t> table(BUCKETS, SLOTS, BITS);

  // Offer far more elements than slots, so that every bucket ends up full of distinct
  // fingerprints
  const size_t offered = table.capacity() * 16;
  std::vector<uint64_t> nums(offered);
  random_gen(offered, nums.data());
  for (const uint64_t num : nums)
    table.lookup_and_insert(num);
  REQUIRE(table.size() == table.capacity());

  std::mt19937_64 gen(42);
  size_t false_positive = 0;
  for (size_t i = 0; i < QUERY_NUM; i++)
    if (table.lookup(gen()))
      false_positive++;

  const double rate = static_cast<double>(false_positive) / static_cast<double>(QUERY_NUM);
  const double expected = qht::expected_false_positive_rate(SLOTS, BITS);
  REQUIRE(rate > expected * 0.8);
  REQUIRE(rate < expected * 1.2);
}

TEST_CASE("QuotientTable should drop elements once a bucket is full", "[quotienttable]") {
  constexpr uint16_t SLOTS = 4;
  QuotientTable<uint64_t> table(64, SLOTS, 16);

  // Collect SLOTS + 1 distinct elements sharing the bucket of 0
  const uint64_t bucket = table.bucket_of(0);
  std::vector<uint64_t> colliding;
  for (uint64_t i = 0; colliding.size() < SLOTS + 1UZ; i++)
    if (table.bucket_of(i) == bucket)
      colliding.push_back(i);

  for (size_t i = 0; i < SLOTS; i++)
    REQUIRE(table.insert(colliding[i]));
  REQUIRE(table.count_in_bucket(bucket) == SLOTS);

  REQUIRE_FALSE(table.insert(colliding[SLOTS]));
  REQUIRE(table.count_in_bucket(bucket) == SLOTS);
  REQUIRE(table.size() == SLOTS);

  // Stored elements are never evicted
  for (size_t i = 0; i < SLOTS; i++)
    REQUIRE(table.lookup(colliding[i]));
}

TEST_CASE("QuotientTable with a single bucket should hold exactly slots_per_bucket elements",
          "[quotienttable]") {
  QuotientTable<uint64_t> table(1, 8, 3);
  const qht::Splitter splitter(1, 3, qht::DEFAULT_HASH_SEED);

  // Pick 8 elements covering all 8 fingerprints of 3 bits
  std::vector<uint64_t> elements(8);
  std::set<uint64_t> seen;
  uint64_t leftover = 0;
  for (uint64_t i = 0; seen.size() < 8; i++) {
    size_t bucket;
    uint64_t fingerprint;
    splitter.split(i, &bucket, &fingerprint);
    REQUIRE(bucket == 0);
    if (seen.insert(fingerprint).second)
      elements[fingerprint] = i;
    leftover = i + 1;
  }

  for (const uint64_t element : elements)
    REQUIRE(table.insert(element));
  for (const uint64_t element : elements)
    REQUIRE(table.lookup(element));

  // Every fingerprint is present now, so anything is reported as seen
  REQUIRE(table.lookup(leftover));
  REQUIRE_FALSE(table.insert(leftover));
  REQUIRE(table.count_in_bucket(0) == 8);
}

TEST_CASE("QuotientTable insert should not detect duplicates", "[quotienttable]") {
  QuotientTable<uint64_t> table(16, 2, 8);

  REQUIRE(table.insert(7));
  REQUIRE(table.insert(7));
  REQUIRE(table.count_in_bucket(table.bucket_of(7)) == 2);
  REQUIRE_FALSE(table.insert(7));
}

TEST_CASE("QuotientTable lookup_and_insert should store each element once", "[quotienttable]") {
  QuotientTable<uint64_t> table(16, 2, 8);

  REQUIRE(table.lookup_and_insert(7) == Status::Inserted);
  REQUIRE(table.lookup(7));
  REQUIRE(table.lookup_and_insert(7) == Status::Found);
  REQUIRE(table.count_in_bucket(table.bucket_of(7)) == 1);
  REQUIRE(std::string(qht::stringify_status(Status::BucketFull)) == "BucketFull");

  SECTION("A full bucket should drop new elements") {
    const uint64_t bucket = table.bucket_of(7);
    std::vector<Status> statuses;
    for (uint64_t i = 100; statuses.size() < 4; i++)
      if (table.bucket_of(i) == bucket)
        statuses.push_back(table.lookup_and_insert(i));

    size_t inserted = 0;
    for (const Status status : statuses)
      if (status == Status::Inserted)
        inserted++;
    REQUIRE(inserted <= 1);
    REQUIRE(table.count_in_bucket(bucket) == 1 + inserted);
  }
}

TEST_CASE("QuotientTable should be deterministic for a fixed seed", "[quotienttable]") {
  std::vector<uint64_t> nums(20'000);
  random_gen(nums.size(), nums.data());

  QuotientTable<uint64_t> first(1 << 10, 4, 6, 2024);
  QuotientTable<uint64_t> second(1 << 10, 4, 6, 2024);
  for (size_t i = 0; i < nums.size(); i++) {
    if (i % 3 == 0)
      REQUIRE(first.insert(nums[i]) == second.insert(nums[i]));
    else
      REQUIRE(first.lookup(nums[i]) == second.lookup(nums[i]));
  }
  REQUIRE(first.size() == second.size());

  SECTION("Different seeds should place elements differently") {
    const QuotientTable<uint64_t> reseeded(1 << 10, 4, 6, 2025);
    size_t moved = 0;
    for (size_t i = 0; i < 1000; i++)
      if (reseeded.bucket_of(nums[i]) != first.bucket_of(nums[i]))
        moved++;
    REQUIRE(moved > 900);
  }

  SECTION("Copies should be independent") {
    QuotientTable<uint64_t> copy = first;
    const size_t size = first.size();
    for (size_t i = 0; i < 1000; i++)
      copy.insert(nums[i] + 1);
    REQUIRE(first.size() == size);
  }
}

TEST_CASE("QuotientTable should accept string elements", "[quotienttable]") {
  QuotientTable<std::string> table(1 << 12, 4, 16);

  REQUIRE(table.insert("192.168.0.1"));
  REQUIRE(table.lookup("192.168.0.1"));
  REQUIRE(table.lookup_and_insert("192.168.0.1") == Status::Found);
  REQUIRE(table.lookup_and_insert("192.168.0.2") == Status::Inserted);
  REQUIRE(table.size() == 2);
}
