#pragma once

#include <cstddef>
#include <cstdint>

namespace qht {

// Width of the hash every element is reduced to
constexpr size_t HASH_BITS = 64UZ;

// A slot is a fingerprint plus one occupied bit and must fit in one 64-bit word
constexpr size_t MAX_FINGERPRINT_BITS = HASH_BITS - 1;

// Used when no seed is given, so that runs are reproducible
constexpr uint64_t DEFAULT_HASH_SEED = 1234;

// XORed into the seed for the second hash pass that derives wide fingerprints
constexpr uint64_t FINGERPRINT_SEED_SALT = 0x9e3779b97f4a7c15ULL;

/* Parameters of the example program */
constexpr uint64_t EXAMPLE_BUCKET_COUNT = 1UZ << 16;
constexpr uint16_t EXAMPLE_SLOTS_PER_BUCKET = 5;
constexpr uint8_t EXAMPLE_FINGERPRINT_BITS = 3;

} // namespace qht
