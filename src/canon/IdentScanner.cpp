#include "canon/IdentScanner.hpp"

#include "spdlog/spdlog.h"

namespace {

inline bool isIdentStart(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; }
inline bool isIdentBody(char c) { return isIdentStart(c) || (c >= '0' && c <= '9'); }
inline bool isDigit(char c) { return c >= '0' && c <= '9'; }

} // namespace

namespace canon {

IdentScanner::IdentScanner(std::string_view code): m_code(code) {}

bool IdentScanner::scan() {
    m_spans.clear();
    size_t pos = 0;
    while (pos < m_code.size()) {
        char c = m_code[pos];

        if (c == '#') {
            while (pos < m_code.size() && m_code[pos] != '\n') {
                ++pos;
            }
        } else if (c == '"') {
            size_t start = pos;
            ++pos;
            while (pos < m_code.size() && m_code[pos] != '"') {
                // Skip escaped characters, including escaped quotes.
                pos += (m_code[pos] == '\\') ? 2 : 1;
            }
            if (pos >= m_code.size()) {
                SPDLOG_ERROR("Unterminated string starting at byte {}", start);
                return false;
            }
            ++pos;
        } else if (isDigit(c)) {
            // Skip numbers whole so `10x` isn't read as the identifier `x`, underscores are digit separators.
            while (pos < m_code.size() && isIdentBody(m_code[pos])) {
                ++pos;
            }
        } else if (isIdentStart(c)) {
            size_t start = pos;
            while (pos < m_code.size() && isIdentBody(m_code[pos])) {
                ++pos;
            }
            if (pos < m_code.size() && m_code[pos] == '!') {
                ++pos;
            }
            m_spans.emplace_back(Span{m_code.substr(start, pos - start),
                                      Region(static_cast<uint32_t>(start), static_cast<uint32_t>(pos))});
        } else {
            ++pos;
        }
    }

    return true;
}

} // namespace canon
