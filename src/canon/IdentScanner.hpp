#ifndef SRC_CANON_IDENT_SCANNER_HPP_
#define SRC_CANON_IDENT_SCANNER_HPP_

#include "canon/Region.hpp"

#include <string_view>
#include <vector>

namespace canon {

// Finds identifier spans in source text for the dump-idents tool. Real compilation gets its identifiers from the
// language tokenizer, this only understands enough syntax to skip `#` line comments and double-quoted strings.
//
// An identifier is [A-Za-z_][A-Za-z0-9_]* with an optional trailing `!`.
class IdentScanner {
public:
    explicit IdentScanner(std::string_view code);
    ~IdentScanner() = default;

    // Returns false on an unterminated string. Identifiers found before the error are kept.
    bool scan();

    struct Span {
        std::string_view text;
        Region region;
    };
    const std::vector<Span>& spans() const { return m_spans; }

private:
    std::string_view m_code;
    std::vector<Span> m_spans;
};

} // namespace canon

#endif // SRC_CANON_IDENT_SCANNER_HPP_
