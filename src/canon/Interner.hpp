#ifndef SRC_CANON_INTERNER_HPP_
#define SRC_CANON_INTERNER_HPP_

#include "canon/Hash.hpp"

#include <cassert>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace canon {

// Deduplicating storage for identifier text. Each distinct byte sequence is copied once and gets a small TextIdx. Text
// is compared byte-for-byte, so `Foo` and `foo` are different texts.
//
// Copied text lives in fixed-size chunks that are never reallocated, so views returned by textOf() stay valid for the
// life of the Interner.
class Interner {
public:
    using TextIdx = uint32_t;

    Interner();
    ~Interner() = default;

    // Returns the index of |text|, copying it in if it has not been seen before.
    TextIdx insert(std::string_view text);

    std::string_view textOf(TextIdx textIdx) const {
        assert(textIdx < m_texts.size());
        return m_texts[textIdx];
    }

    // Dedup guarantees one index per distinct text, so this is index equality.
    bool sameText(TextIdx a, TextIdx b) const { return a == b; }

    // The set of indices whose text equals |text|, which holds at most one element.
    std::optional<TextIdx> lookup(std::string_view text) const;

    // Number of distinct texts.
    size_t size() const { return m_texts.size(); }
    // Total bytes of copied text.
    size_t textBytes() const { return m_textBytes; }

    static constexpr TextIdx kNoText = 0xffffffff;
    static constexpr size_t kChunkSize = 16 * 1024;

private:
    std::string_view copyText(std::string_view text);

    // Indexed by TextIdx.
    std::vector<std::string_view> m_texts;
    // Next TextIdx with the same hash, or kNoText at the end of the chain. Indexed by TextIdx.
    std::vector<TextIdx> m_nextCollision;
    // Maps a text hash to the first TextIdx with that hash.
    std::unordered_map<Hash, TextIdx> m_buckets;

    std::vector<std::unique_ptr<char[]>> m_chunks;
    size_t m_chunkUsed;
    size_t m_chunkCapacity;
    size_t m_textBytes;
};

} // namespace canon

#endif // SRC_CANON_INTERNER_HPP_
