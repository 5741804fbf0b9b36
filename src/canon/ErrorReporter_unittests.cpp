#include "canon/ErrorReporter.hpp"

#include <doctest/doctest.h>

#include <string>

namespace canon {

TEST_CASE("ErrorReporter line numbers") {
    SUBCASE("empty string") {
        ErrorReporter er(true);
        std::string code("");
        er.setCode(code);
        CHECK(er.getLineNumber(0) == 1);
    }
    SUBCASE("one liner") {
        ErrorReporter er(true);
        std::string code("let total_ = add!(a__b, _unused)");
        er.setCode(code);
        CHECK(er.getLineNumber(0) == 1);
        CHECK(er.getLineNumber(10) == 1);
        CHECK(er.getLineNumber(code.size()) == 1);
    }
    SUBCASE("multiline string") {
        ErrorReporter er(true);
        std::string code("one\n two\n three\n four\n five\n");
        er.setCode(code);
        CHECK(er.getLineNumber(1) == 1);
        CHECK(er.getLineNumber(3) == 1);
        CHECK(er.getLineNumber(4) == 2);
        CHECK(er.getLineNumber(9) == 3);
        CHECK(er.getLineNumber(16) == 4);
        CHECK(er.getLineNumber(22) == 5);
    }
    SUBCASE("multiple empty lines") {
        ErrorReporter er(true);
        std::string code("\n\n\n\n\n\n\n7");
        er.setCode(code);
        CHECK(er.getLineNumber(0) == 1);
        CHECK(er.getLineNumber(1) == 2);
        CHECK(er.getLineNumber(2) == 3);
        CHECK(er.getLineNumber(6) == 7);
        CHECK(er.getLineNumber(7) == 8);
    }
    SUBCASE("new code resets lines") {
        ErrorReporter er(true);
        std::string first("a\nb\nc");
        std::string second("abc");
        er.setCode(first);
        CHECK(er.getLineNumber(4) == 3);
        er.setCode(second);
        CHECK(er.getLineNumber(2) == 1);
    }
}

TEST_CASE("ErrorReporter problems") {
    SUBCASE("starts clean") {
        ErrorReporter er(true);
        CHECK(er.ok());
        CHECK(er.problems().empty());
        CHECK(er.errorCount() == 0);
        CHECK(er.warningCount() == 0);
    }
    SUBCASE("ident issues are warnings") {
        ErrorReporter er(true);
        Problems problems;
        problems.subsequentUnderscores = true;
        er.addIdentIssue(problems, Region(2, 6));
        CHECK(er.ok());
        CHECK(er.warningCount() == 1);
        REQUIRE(er.problems().size() == 1);
        CHECK(er.problems()[0].kind == Problem::Kind::kIdentIssue);
        CHECK(!er.problems()[0].isFatal());
        CHECK(er.problems()[0].identProblems == problems);
        CHECK(er.problems()[0].region == Region(2, 6));
    }
    SUBCASE("capacity errors are fatal") {
        ErrorReporter er(true);
        er.addCapacityExceededError(100, Region(5, 9));
        CHECK(!er.ok());
        CHECK(er.errorCount() == 1);
        CHECK(er.warningCount() == 0);
        REQUIRE(er.problems().size() == 1);
        CHECK(er.problems()[0].isFatal());
        CHECK(er.problems()[0].capacity == 100);
    }
    SUBCASE("logging with code set") {
        // Not suppressed, exercises the log formatting with and without source code.
        ErrorReporter er;
        Problems problems;
        problems.subsequentUnderscores = true;
        er.addIdentIssue(problems, Region(0, 4));
        std::string code("x\na__b");
        er.setCode(code);
        er.addIdentIssue(problems, Region(2, 6));
        CHECK(er.warningCount() == 2);
        CHECK(er.problems()[1].region == Region(2, 6));
    }
    SUBCASE("line endings scanned once for code without newlines") {
        ErrorReporter er(true);
        std::string code("abc def");
        er.setCode(code);
        CHECK(er.getLineNumber(4) == 1);
        // The reporter keeps a view of the buffer. A newline written after the first lookup must not be seen, the
        // table was already built.
        code[3] = '\n';
        CHECK(er.getLineNumber(4) == 1);
        CHECK(er.getLineNumber(6) == 1);
        er.setCode(code);
        CHECK(er.getLineNumber(2) == 1);
        CHECK(er.getLineNumber(4) == 2);
    }
}

} // namespace canon
