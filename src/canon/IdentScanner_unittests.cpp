#include "canon/IdentScanner.hpp"

#include "doctest/doctest.h"

namespace canon {

TEST_CASE("IdentScanner") {
    SUBCASE("empty code") {
        IdentScanner scanner("");
        REQUIRE(scanner.scan());
        CHECK(scanner.spans().empty());
    }
    SUBCASE("identifiers with regions") {
        const char* code = "main! = \\{} -> x_ + _y";
        IdentScanner scanner(code);
        REQUIRE(scanner.scan());
        REQUIRE(scanner.spans().size() == 3);
        CHECK(scanner.spans()[0].text == "main!");
        CHECK(scanner.spans()[0].region == Region(0, 5));
        CHECK(scanner.spans()[0].text.data() == code);
        CHECK(scanner.spans()[1].text == "x_");
        CHECK(scanner.spans()[1].region == Region(15, 17));
        CHECK(scanner.spans()[2].text == "_y");
        CHECK(scanner.spans()[2].region == Region(20, 22));
    }
    SUBCASE("skips comments strings and numbers") {
        IdentScanner scanner("a # b c\n\"d \\\" e\" 10f 1_000 g");
        REQUIRE(scanner.scan());
        REQUIRE(scanner.spans().size() == 2);
        CHECK(scanner.spans()[0].text == "a");
        CHECK(scanner.spans()[1].text == "g");
    }
    SUBCASE("unterminated string") {
        IdentScanner scanner("x \"never closed");
        CHECK(!scanner.scan());
        REQUIRE(scanner.spans().size() == 1);
        CHECK(scanner.spans()[0].text == "x");
    }
}

} // namespace canon
