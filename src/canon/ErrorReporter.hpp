#ifndef SRC_CANON_ERROR_REPORTER_HPP_
#define SRC_CANON_ERROR_REPORTER_HPP_

#include "canon/Ident.hpp"
#include "canon/Region.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace canon {

// A structured diagnostic entry. Rendering into user-facing text happens downstream, the reporter only keeps the
// facts.
struct Problem {
    enum Kind : int32_t {
        kIdentIssue = 0,       // Style problem in an identifier, reported as a warning.
        kCapacityExceeded = 1  // Too many identifier occurrences for one store, fatal.
    };

    bool isFatal() const { return kind == kCapacityExceeded; }

    Kind kind;
    // Valid for kIdentIssue.
    Problems identProblems;
    Region region;
    // Valid for kCapacityExceeded, the occurrence limit that was hit.
    uint32_t capacity = 0;
};

class ErrorReporter {
public:
    // If suppress is true, will not print reported problems to log (useful for testing failures without polluting the
    // log)
    ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    // Optional, if set then logged problems include line numbers.
    void setCode(std::string_view code);

    // Non-fatal, the identifier is still interned.
    void addIdentIssue(Problems problems, Region region);
    // Fatal compiler error, the identifier store can't take another occurrence.
    void addCapacityExceededError(uint32_t capacity, Region region);

    // 1-based line number of the byte at |offset| in the code provided to setCode().
    size_t getLineNumber(uint32_t offset);

    const std::vector<Problem>& problems() const { return m_problems; }
    size_t errorCount() const { return m_errorCount; }
    size_t warningCount() const { return m_problems.size() - m_errorCount; }
    bool ok() const { return m_errorCount == 0; }

private:
    bool m_suppress;
    std::string_view m_code;
    size_t m_errorCount;
    std::vector<Problem> m_problems;
    // Offsets of each newline in m_code, computed lazily.
    bool m_lineEndingsBuilt;
    std::vector<uint32_t> m_lineEndings;
};

} // namespace canon

#endif // SRC_CANON_ERROR_REPORTER_HPP_
