#ifndef SRC_CANON_HASH_HPP_
#define SRC_CANON_HASH_HPP_

#include <cstdint>
#include <string_view>

namespace canon {

using Hash = std::uint32_t;

// Bucket hash for interned identifier text. Equal text always hashes equal, different text may collide, so callers
// must still compare bytes. Stable for the life of the process, not across builds of the compiler.
Hash hash(std::string_view text);

} // namespace canon

#endif // SRC_CANON_HASH_HPP_
