#include "canon/Interner.hpp"

#include <algorithm>
#include <cstring>

namespace canon {

Interner::Interner(): m_chunkUsed(0), m_chunkCapacity(0), m_textBytes(0) {}

Interner::TextIdx Interner::insert(std::string_view text) {
    Hash h = hash(text);
    auto bucketIter = m_buckets.find(h);
    if (bucketIter != m_buckets.end()) {
        TextIdx textIdx = bucketIter->second;
        TextIdx lastIdx = textIdx;
        while (textIdx != kNoText) {
            if (m_texts[textIdx] == text) {
                return textIdx;
            }
            lastIdx = textIdx;
            textIdx = m_nextCollision[textIdx];
        }

        // Hash collision with a different text, chain the new text on to the end of the bucket.
        TextIdx newIdx = static_cast<TextIdx>(m_texts.size());
        m_texts.emplace_back(copyText(text));
        m_nextCollision.emplace_back(kNoText);
        m_nextCollision[lastIdx] = newIdx;
        return newIdx;
    }

    TextIdx newIdx = static_cast<TextIdx>(m_texts.size());
    m_texts.emplace_back(copyText(text));
    m_nextCollision.emplace_back(kNoText);
    m_buckets.emplace(std::make_pair(h, newIdx));
    return newIdx;
}

std::optional<Interner::TextIdx> Interner::lookup(std::string_view text) const {
    auto bucketIter = m_buckets.find(hash(text));
    if (bucketIter == m_buckets.end()) {
        return std::nullopt;
    }

    TextIdx textIdx = bucketIter->second;
    while (textIdx != kNoText) {
        if (m_texts[textIdx] == text) {
            return textIdx;
        }
        textIdx = m_nextCollision[textIdx];
    }
    return std::nullopt;
}

std::string_view Interner::copyText(std::string_view text) {
    if (text.empty()) {
        return std::string_view();
    }

    if (m_chunkCapacity - m_chunkUsed < text.size()) {
        // Text longer than a chunk gets a chunk to itself.
        m_chunkCapacity = std::max(kChunkSize, text.size());
        m_chunks.emplace_back(std::make_unique<char[]>(m_chunkCapacity));
        m_chunkUsed = 0;
    }

    char* dest = m_chunks.back().get() + m_chunkUsed;
    std::memcpy(dest, text.data(), text.size());
    m_chunkUsed += text.size();
    m_textBytes += text.size();
    return std::string_view(dest, text.size());
}

} // namespace canon
