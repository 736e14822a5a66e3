#pragma once

#include <cstdint>

namespace qht {

/*-----------------------------------------------------------------------------
// MurmurHash2, 64-bit version, by Austin Appleby
//
// Beware of alignment and endian-ness issues if hashes are compared across
// platforms. Hashes are only ever compared within one process here.
//
// 64-bit hash for 64-bit platforms
*/
auto murmur_hash2_x64_a(const void *key, int len, uint64_t seed) -> uint64_t;

/**
 * @brief Hash a 64-bit value once more. Used for the second pass when a fingerprint needs more
 * bits than the first hash has left after the bucket index was taken.
 *
 * @param value The value to rehash (usually a previous hash).
 * @param seed The seed.
 * @return The new hash.
 */
auto rehash_64(uint64_t value, uint64_t seed) -> uint64_t;

} // namespace qht
