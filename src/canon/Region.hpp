#ifndef SRC_CANON_REGION_HPP_
#define SRC_CANON_REGION_HPP_

#include <cstdint>

namespace canon {

// A span of source code, as byte offsets into the compiled text. The identifier store never interprets a Region, it
// only hands back what it was given.
struct Region {
    Region() = default;
    Region(uint32_t s, uint32_t e): start(s), end(e) {}
    ~Region() = default;

    uint32_t size() const { return end - start; }

    inline bool operator==(const Region& r) const { return start == r.start && end == r.end; }
    inline bool operator!=(const Region& r) const { return start != r.start || end != r.end; }

    uint32_t start = 0;
    uint32_t end = 0;
};

} // namespace canon

#endif // SRC_CANON_REGION_HPP_
