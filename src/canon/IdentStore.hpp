#ifndef SRC_CANON_IDENT_STORE_HPP_
#define SRC_CANON_IDENT_STORE_HPP_

#include "canon/IdentIdx.hpp"
#include "canon/Interner.hpp"
#include "canon/Module.hpp"
#include "canon/Region.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string_view>
#include <vector>

namespace canon {

class ErrorReporter;

// Owns every identifier of one compilation unit. Created before parsing the unit and destroyed once later passes are
// done with its handles. An IdentIdx is only meaningful to the IdentStore that produced it.
//
// Each call to insert() or genUnique() makes a new occurrence, even for repeated text, and grows every occurrence
// side table by exactly one entry. The interner only decides whether the bytes need copying.
class IdentStore {
public:
    IdentStore();
    // Lowers the occurrence limit, clamped to IdentIdx::kMaxOccurrences.
    explicit IdentStore(uint32_t capacity);
    ~IdentStore() = default;

    // Iterates every occurrence with a given text, in insertion order, without allocating.
    class Occurrences {
    public:
        class Iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = IdentIdx;
            using difference_type = std::ptrdiff_t;
            using pointer = const IdentIdx*;
            using reference = IdentIdx;

            Iterator(const IdentStore* store, uint32_t index): m_store(store), m_index(index) {}

            IdentIdx operator*() const { return m_store->occurrence(m_index); }
            Iterator& operator++() {
                m_index = m_store->m_nextSameText[m_index];
                return *this;
            }
            Iterator operator++(int) {
                Iterator prior = *this;
                ++(*this);
                return prior;
            }
            bool operator==(const Iterator& i) const { return m_index == i.m_index; }
            bool operator!=(const Iterator& i) const { return m_index != i.m_index; }

        private:
            const IdentStore* m_store;
            uint32_t m_index;
        };

        Occurrences(const IdentStore* store, uint32_t first): m_store(store), m_first(first) {}

        Iterator begin() const { return Iterator(m_store, m_first); }
        Iterator end() const { return Iterator(m_store, kNoOccurrence); }
        bool empty() const { return m_first == kNoOccurrence; }
        size_t size() const { return static_cast<size_t>(std::distance(begin(), end())); }

    private:
        const IdentStore* m_store;
        uint32_t m_first;
    };

    // Interns |text| as a new occurrence at |region|. Style problems go to |errorReporter| as warnings and never stop
    // the insertion. Returns an invalid IdentIdx and reports a fatal error if the store is full.
    IdentIdx insert(std::string_view text, Region region, ErrorReporter* errorReporter);

    // Makes a compiler-generated name, the decimal rendering of a counter that starts at zero and advances once per
    // call, so generated names never repeat within a store. All attributes are false.
    IdentIdx genUnique(Region region, ErrorReporter* errorReporter);

    // True if both handles spell the same text, regardless of attributes or regions.
    bool sameText(IdentIdx a, IdentIdx b) const {
        return m_interner.sameText(m_textIndices[checkIndex(a)], m_textIndices[checkIndex(b)]);
    }

    // Every occurrence inserted with exactly |text|.
    Occurrences lookup(std::string_view text) const;

    std::string_view textOf(IdentIdx idx) const { return m_interner.textOf(m_textIndices[checkIndex(idx)]); }
    Region regionOf(IdentIdx idx) const { return m_regions[checkIndex(idx)]; }
    // kPrimaryModule until setExposingModule() is called.
    ModuleIdx exposingModuleOf(IdentIdx idx) const { return m_exposingModules[checkIndex(idx)]; }

    // Records the module import that exposes this occurrence. Name resolution must call this as soon as it first sees
    // the handle, before any other pass reads exposingModuleOf().
    void setExposingModule(IdentIdx idx, ModuleIdx module) { m_exposingModules[checkIndex(idx)] = module; }

    // The handle for the occurrence at |index|, as originally returned by insert() or genUnique().
    IdentIdx occurrence(uint32_t index) const {
        assert(index < m_attributes.size());
        return IdentIdx::make(index, Attributes::unpack(m_attributes[index]));
    }

    // Number of occurrences.
    size_t size() const { return m_regions.size(); }
    uint32_t capacity() const { return m_capacity; }
    const Interner& interner() const { return m_interner; }

    static constexpr uint32_t kNoOccurrence = 0xffffffff;

private:
    IdentIdx addOccurrence(std::string_view text, Attributes attributes, Region region, ErrorReporter* errorReporter);

    inline size_t checkIndex(IdentIdx idx) const {
        assert(idx.isValid());
        assert(idx.index() < m_regions.size());
        return idx.index();
    }

    Interner m_interner;
    uint32_t m_capacity;
    uint32_t m_nextUniqueName;

    // Occurrence side tables, all indexed by occurrence index and always the same length.
    std::vector<Interner::TextIdx> m_textIndices;
    std::vector<Region> m_regions;
    std::vector<ModuleIdx> m_exposingModules;
    std::vector<uint8_t> m_attributes;
    // Next occurrence with the same text, or kNoOccurrence.
    std::vector<uint32_t> m_nextSameText;

    // Indexed by Interner::TextIdx, the ends of the chain of occurrences of that text.
    std::vector<uint32_t> m_firstOccurrence;
    std::vector<uint32_t> m_lastOccurrence;
};

} // namespace canon

#endif // SRC_CANON_IDENT_STORE_HPP_
