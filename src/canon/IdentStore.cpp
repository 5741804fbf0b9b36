#include "canon/IdentStore.hpp"

#include "canon/ErrorReporter.hpp"

#include "fmt/format.h"

#include <algorithm>

namespace canon {

IdentStore::IdentStore(): IdentStore(IdentIdx::kMaxOccurrences) {}

IdentStore::IdentStore(uint32_t capacity):
    m_capacity(std::min(capacity, IdentIdx::kMaxOccurrences)), m_nextUniqueName(0) {}

IdentIdx IdentStore::insert(std::string_view text, Region region, ErrorReporter* errorReporter) {
    assert(errorReporter);
    Ident ident = Ident::forText(text);
    if (ident.problems.hasProblems()) {
        errorReporter->addIdentIssue(ident.problems, region);
    }

    return addOccurrence(ident.rawText, ident.attributes, region, errorReporter);
}

IdentIdx IdentStore::genUnique(Region region, ErrorReporter* errorReporter) {
    assert(errorReporter);
    // Don't spend a counter value on a name that can't be stored.
    if (m_regions.size() >= m_capacity) {
        errorReporter->addCapacityExceededError(m_capacity, region);
        return IdentIdx::makeInvalid();
    }

    // format_int renders into its own stack buffer, the interner copies the digits out.
    fmt::format_int name(m_nextUniqueName);
    ++m_nextUniqueName;
    return addOccurrence(std::string_view(name.data(), name.size()), Attributes(), region, errorReporter);
}

IdentStore::Occurrences IdentStore::lookup(std::string_view text) const {
    auto textIdx = m_interner.lookup(text);
    if (!textIdx) {
        return Occurrences(this, kNoOccurrence);
    }
    return Occurrences(this, m_firstOccurrence[*textIdx]);
}

IdentIdx IdentStore::addOccurrence(std::string_view text, Attributes attributes, Region region,
                                   ErrorReporter* errorReporter) {
    // Check before interning, a failed insert leaves no trace in the store.
    if (m_regions.size() >= m_capacity) {
        errorReporter->addCapacityExceededError(m_capacity, region);
        return IdentIdx::makeInvalid();
    }

    uint32_t index = static_cast<uint32_t>(m_regions.size());
    Interner::TextIdx textIdx = m_interner.insert(text);
    if (textIdx == m_firstOccurrence.size()) {
        m_firstOccurrence.emplace_back(index);
        m_lastOccurrence.emplace_back(index);
    } else {
        m_nextSameText[m_lastOccurrence[textIdx]] = index;
        m_lastOccurrence[textIdx] = index;
    }

    m_textIndices.emplace_back(textIdx);
    m_regions.emplace_back(region);
    m_exposingModules.emplace_back(kPrimaryModule);
    m_attributes.emplace_back(attributes.pack());
    m_nextSameText.emplace_back(kNoOccurrence);

    return IdentIdx::make(index, attributes);
}

} // namespace canon
