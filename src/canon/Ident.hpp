#ifndef SRC_CANON_IDENT_HPP_
#define SRC_CANON_IDENT_HPP_

#include <cstdint>
#include <string_view>

namespace canon {

// Naming conventions that give an identifier its meaning. These are fixed properties of the language.
static constexpr char kEffectfulSuffix = '!';    // `main!`, `write!`
static constexpr char kIgnoredPrefix = '_';      // `_unused`
static constexpr char kReassignableSuffix = '_'; // `count_`

// Semantic flags of one identifier occurrence, packed into 3 bits inside an IdentIdx.
struct Attributes {
    // Bit positions in the packed form.
    enum Bits : uint8_t {
        kNoBits = 0x00,
        kEffectfulBit = 0x01,
        kIgnoredBit = 0x02,
        kReassignableBit = 0x04,
        kAllBits = 0x07
    };

    static constexpr Attributes unpack(uint8_t bits) {
        return Attributes{(bits & kEffectfulBit) != 0, (bits & kIgnoredBit) != 0, (bits & kReassignableBit) != 0};
    }
    constexpr uint8_t pack() const {
        return static_cast<uint8_t>((effectful ? kEffectfulBit : kNoBits) | (ignored ? kIgnoredBit : kNoBits) |
                                    (reassignable ? kReassignableBit : kNoBits));
    }

    inline bool operator==(const Attributes& a) const { return pack() == a.pack(); }
    inline bool operator!=(const Attributes& a) const { return pack() != a.pack(); }

    bool effectful = false;
    bool ignored = false;
    bool reassignable = false;
};

// Style problems found in an identifier. These never stop compilation, they are reported later as warnings.
struct Problems {
    bool hasProblems() const { return subsequentUnderscores; }

    inline bool operator==(const Problems& p) const { return subsequentUnderscores == p.subsequentUnderscores; }
    inline bool operator!=(const Problems& p) const { return !(*this == p); }

    // Two or more `_` in a row anywhere in the text, like `a__b`.
    bool subsequentUnderscores = false;
};

// An identifier as lexed from the source, before it is interned. |rawText| is not owned and must outlive the Ident.
struct Ident {
    // Derives attributes and problems from the spelling alone. A lone `_` is the ignored pattern and is not
    // reassignable, even though it both starts and ends with an underscore.
    static Ident forText(std::string_view text);

    std::string_view rawText;
    Attributes attributes;
    Problems problems;
};

} // namespace canon

#endif // SRC_CANON_IDENT_HPP_
