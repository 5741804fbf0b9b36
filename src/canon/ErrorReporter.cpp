#include "canon/ErrorReporter.hpp"

#include "spdlog/spdlog.h"

#include <algorithm>

namespace canon {

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress), m_errorCount(0), m_lineEndingsBuilt(false) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::setCode(std::string_view code) {
    m_code = code;
    m_lineEndings.clear();
    m_lineEndingsBuilt = false;
}

void ErrorReporter::addIdentIssue(Problems problems, Region region) {
    Problem problem;
    problem.kind = Problem::Kind::kIdentIssue;
    problem.identProblems = problems;
    problem.region = region;
    m_problems.emplace_back(problem);

    if (m_suppress) {
        return;
    }

    if (problems.subsequentUnderscores) {
        if (region.start <= region.end && region.end <= m_code.size()) {
            SPDLOG_WARN("line {}: identifier '{}' has two or more underscores in a row", getLineNumber(region.start),
                        m_code.substr(region.start, region.size()));
        } else {
            SPDLOG_WARN("identifier at [{}, {}) has two or more underscores in a row", region.start, region.end);
        }
    }
}

void ErrorReporter::addCapacityExceededError(uint32_t capacity, Region region) {
    Problem problem;
    problem.kind = Problem::Kind::kCapacityExceeded;
    problem.region = region;
    problem.capacity = capacity;
    m_problems.emplace_back(problem);
    ++m_errorCount;

    if (!m_suppress) {
        SPDLOG_ERROR("Identifier store full, compilation unit has more than {} identifier occurrences", capacity);
    }
}

size_t ErrorReporter::getLineNumber(uint32_t offset) {
    // Lazily construct the line ending map on first request for line number. Code without newlines leaves the map
    // empty, so track construction separately.
    if (!m_lineEndingsBuilt) {
        for (size_t i = 0; i < m_code.size(); ++i) {
            if (m_code[i] == '\n') {
                m_lineEndings.emplace_back(static_cast<uint32_t>(i));
            }
        }
        m_lineEndingsBuilt = true;
    }

    // Every newline strictly before the offset starts a new line.
    auto lineIter = std::lower_bound(m_lineEndings.begin(), m_lineEndings.end(), offset);
    return static_cast<size_t>(lineIter - m_lineEndings.begin()) + 1;
}

} // namespace canon
