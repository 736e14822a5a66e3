#include <cstddef>
#include <cstdint>
#include <cstring>

#include "hash.hpp"

namespace qht {

namespace {

constexpr uint64_t MURMUR_M = 0xc6a4a7935bd1e995ULL;
constexpr int MURMUR_R = 47;

} // namespace

auto murmur_hash2_x64_a(const void *key, const int len, const uint64_t seed) -> uint64_t {
  uint64_t h = seed ^ (static_cast<uint64_t>(len) * MURMUR_M);

  const auto *data = static_cast<const unsigned char *>(key);
  const unsigned char *end = data + (len / 8) * 8;

  for (; data != end; data += 8) {
    // Keys may be unaligned (string data), so never dereference a uint64_t pointer here
    uint64_t k;
    std::memcpy(&k, data, sizeof(k));

    k *= MURMUR_M;
    k ^= k >> MURMUR_R;
    k *= MURMUR_M;

    h ^= k;
    h *= MURMUR_M;
  }

  const size_t tail = static_cast<size_t>(len) & 7;
  if (tail != 0) {
    for (size_t i = tail; i-- > 0;)
      h ^= static_cast<uint64_t>(data[i]) << (8 * i);
    h *= MURMUR_M;
  }

  h ^= h >> MURMUR_R;
  h *= MURMUR_M;
  h ^= h >> MURMUR_R;

  return h;
}

auto rehash_64(const uint64_t value, const uint64_t seed) -> uint64_t {
  return murmur_hash2_x64_a(&value, sizeof(value), seed);
}

} // namespace qht
