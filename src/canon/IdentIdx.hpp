#ifndef SRC_CANON_IDENT_IDX_HPP_
#define SRC_CANON_IDENT_IDX_HPP_

#include "canon/Ident.hpp"

#include <cassert>
#include <cstdint>
#include <functional>
#include <type_traits>

namespace canon {

// Handle to one identifier occurrence in an IdentStore, small enough to embed directly in AST nodes. Layout:
//
//   bit: 31                                   3 2 1 0
//        iiiiiiii|iiiiiiii|iiiiiiii|iiiii     r g e
//
// i: 29-bit occurrence index, e: effectful, g: ignored, r: reassignable.
//
// The index is the occurrence index, never the interner's text index, so every occurrence owns its own slot in the
// store side tables even when its spelling repeats.
class IdentIdx {
public:
    IdentIdx(): m_bits(kInvalidBits) {}
    IdentIdx(const IdentIdx& i) = default;
    IdentIdx& operator=(const IdentIdx& i) = default;
    ~IdentIdx() = default;

    static constexpr uint32_t kAttributeBitCount = 3;
    static constexpr uint32_t kAttributeMask = 0x00000007;
    static constexpr uint32_t kIndexBitCount = 29;
    // All ones in the index field marks an invalid handle, so the largest usable index is one less.
    static constexpr uint32_t kInvalidIndex = (1u << kIndexBitCount) - 1;
    static constexpr uint32_t kMaxOccurrences = kInvalidIndex;

    static constexpr IdentIdx make(uint32_t index, Attributes attributes) {
        assert(index < kInvalidIndex);
        return IdentIdx((index << kAttributeBitCount) | attributes.pack());
    }
    static constexpr IdentIdx makeInvalid() { return IdentIdx(kInvalidBits); }
    static constexpr IdentIdx makeFromBits(uint32_t bits) { return IdentIdx(bits); }

    // Handles are equal only if both the occurrence and the attributes match. Use IdentStore::sameText() to compare
    // spellings.
    inline bool operator==(const IdentIdx& i) const { return m_bits == i.m_bits; }
    inline bool operator!=(const IdentIdx& i) const { return m_bits != i.m_bits; }

    inline bool isValid() const { return index() != kInvalidIndex; }
    inline uint32_t index() const { return m_bits >> kAttributeBitCount; }
    inline Attributes attributes() const { return Attributes::unpack(static_cast<uint8_t>(m_bits & kAttributeMask)); }

    inline bool isEffectful() const { return m_bits & Attributes::kEffectfulBit; }
    inline bool isIgnored() const { return m_bits & Attributes::kIgnoredBit; }
    inline bool isReassignable() const { return m_bits & Attributes::kReassignableBit; }

    // For serialization and debugging, normal access should use index() and attributes().
    inline uint32_t asBits() const { return m_bits; }

private:
    explicit constexpr IdentIdx(uint32_t bits): m_bits(bits) {}

    static constexpr uint32_t kInvalidBits = kInvalidIndex << kAttributeBitCount;

    uint32_t m_bits;
};

static_assert(sizeof(IdentIdx) == 4);
static_assert(std::is_trivially_copyable<IdentIdx>::value);

} // namespace canon

namespace std {
template <> struct hash<canon::IdentIdx> {
    size_t operator()(const canon::IdentIdx& i) const { return std::hash<uint32_t>()(i.asBits()); }
};
} // namespace std

#endif // SRC_CANON_IDENT_IDX_HPP_
