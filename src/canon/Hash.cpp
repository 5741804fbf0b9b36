#include "canon/Hash.hpp"

#include "xxhash.h"

namespace {
// Arbitrary fixed seed, keeps identifier buckets apart from any other XXH32 table hashing the same bytes.
constexpr XXH32_hash_t kIdentSeed = 0x1de47u;
} // namespace

namespace canon {

Hash hash(std::string_view text) { return XXH32(text.data(), text.size(), kIdentSeed); }

} // namespace canon
