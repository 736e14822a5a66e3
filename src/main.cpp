/*
 * An example of how to use QHT as a stream duplicate detector.
 *
 * For benchmarks, see the `benchmark/` directory.
 */

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include <spdlog/spdlog.h>

#include "QHT.hpp"
#include "predefine.hpp"

using namespace qht;

constexpr size_t DISTINCT_NUM = 1 << 18;
// Each distinct element appears this many times in the stream on average
constexpr size_t REPEAT = 4;

void random_gen(size_t n, uint64_t *store) {
  std::mt19937 rd(12821);
  const auto rand_range = static_cast<uint64_t>(std::pow(2, 64) / static_cast<double>(n));
  for (size_t i = 0; i < n; i++) {
    const uint64_t rand = rand_range * i + rd() % rand_range;
    store[i] = rand;
  }
}

auto main() -> int {
  spdlog::set_level(spdlog::level::debug);

  QuotientTable<uint64_t> filter(EXAMPLE_BUCKET_COUNT, EXAMPLE_SLOTS_PER_BUCKET,
                                 EXAMPLE_FINGERPRINT_BITS);

  std::vector<uint64_t> distinct(DISTINCT_NUM);
  random_gen(DISTINCT_NUM, distinct.data());

  // Stream: distinct elements picked uniformly, so most of them show up several times
  std::mt19937_64 pick(42);
  std::vector<uint64_t> stream(DISTINCT_NUM * REPEAT);
  for (uint64_t &item : stream)
    item = distinct[pick() % DISTINCT_NUM];

  spdlog::info("Stream length: {}, distinct elements: {}, table: {} slots in {} KiB",
               stream.size(), DISTINCT_NUM, filter.capacity(), filter.size_in_bits() / 8 / 1024);

  // Detect duplicates
  size_t found_count = 0;
  size_t inserted_count = 0;
  size_t dropped_count = 0;
  const auto start = std::chrono::high_resolution_clock::now();
  for (const uint64_t item : stream) {
    switch (filter.lookup_and_insert(item)) {
    case Status::Found:
      found_count++;
      break;
    case Status::Inserted:
      inserted_count++;
      break;
    case Status::BucketFull:
      dropped_count++;
      break;
    }
  }
  const auto end = std::chrono::high_resolution_clock::now();

  std::chrono::duration<double> duration = end - start;

  spdlog::info("Processed {} items in {:.4f} seconds", stream.size(), duration.count());
  spdlog::info("Throughput: {:.2f} Mops/s",
               static_cast<double>(stream.size()) / duration.count() / 1'000'000.0);
  spdlog::info("Reported duplicates: {}, inserted: {}, dropped (bucket full): {}", found_count,
               inserted_count, dropped_count);
  spdlog::info("Load factor: {:.2f}%", filter.load_factor() * 100.0);
  if (dropped_count > 0)
    spdlog::warn("{} items were dropped, later copies of them are reported as new", dropped_count);

  // False positive rate, against elements that never appeared in the stream
  std::mt19937_64 fresh(7);
  constexpr size_t QUERY_NUM = 1 << 20;
  size_t false_positive_query = 0;
  for (size_t i = 0; i < QUERY_NUM; i++)
    if (filter.lookup(fresh()))
      false_positive_query++;
  spdlog::info("False positive rate: {:.4f}% (full bucket bound {:.4f}%)",
               static_cast<double>(false_positive_query) * 100.0 / QUERY_NUM,
               expected_false_positive_rate(EXAMPLE_SLOTS_PER_BUCKET, EXAMPLE_FINGERPRINT_BITS) *
                   100.0);

  return 0;
}
