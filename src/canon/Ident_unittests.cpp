#include "canon/Ident.hpp"

#include "doctest/doctest.h"

namespace canon {

TEST_CASE("Ident attributes") {
    SUBCASE("plain") {
        auto ident = Ident::forText("foo");
        CHECK_EQ(ident.rawText, "foo");
        CHECK(!ident.attributes.effectful);
        CHECK(!ident.attributes.ignored);
        CHECK(!ident.attributes.reassignable);
        CHECK(!ident.problems.hasProblems());
    }
    SUBCASE("empty") {
        auto ident = Ident::forText("");
        CHECK_EQ(ident.attributes, Attributes());
        CHECK(!ident.problems.hasProblems());
    }
    SUBCASE("effectful") {
        auto ident = Ident::forText("foo!");
        CHECK(ident.attributes.effectful);
        CHECK(!ident.attributes.ignored);
        CHECK(!ident.attributes.reassignable);
    }
    SUBCASE("ignored") {
        auto ident = Ident::forText("_x");
        CHECK(!ident.attributes.effectful);
        CHECK(ident.attributes.ignored);
        CHECK(!ident.attributes.reassignable);
    }
    SUBCASE("reassignable") {
        auto ident = Ident::forText("x_");
        CHECK(!ident.attributes.effectful);
        CHECK(!ident.attributes.ignored);
        CHECK(ident.attributes.reassignable);
    }
    SUBCASE("lone underscore is ignored only") {
        auto ident = Ident::forText("_");
        CHECK(!ident.attributes.effectful);
        CHECK(ident.attributes.ignored);
        CHECK(!ident.attributes.reassignable);
        CHECK(!ident.problems.hasProblems());
    }
    SUBCASE("ignored and reassignable") {
        auto ident = Ident::forText("_x_");
        CHECK(ident.attributes.ignored);
        CHECK(ident.attributes.reassignable);
    }
    SUBCASE("ignored and effectful") {
        auto ident = Ident::forText("_run!");
        CHECK(ident.attributes.effectful);
        CHECK(ident.attributes.ignored);
        CHECK(!ident.attributes.reassignable);
    }
    SUBCASE("bang hides trailing underscore") {
        auto ident = Ident::forText("x_!");
        CHECK(ident.attributes.effectful);
        CHECK(!ident.attributes.reassignable);
    }
    SUBCASE("case and interior characters don't matter") {
        auto ident = Ident::forText("Main!");
        CHECK(ident.attributes.effectful);
        ident = Ident::forText("a_b");
        CHECK_EQ(ident.attributes, Attributes());
        CHECK(!ident.problems.hasProblems());
    }
}

TEST_CASE("Ident problems") {
    SUBCASE("double underscore inside") {
        auto ident = Ident::forText("a__b");
        CHECK(ident.problems.subsequentUnderscores);
        CHECK(ident.problems.hasProblems());
        CHECK_EQ(ident.attributes, Attributes());
    }
    SUBCASE("double underscore leading") {
        auto ident = Ident::forText("__init");
        CHECK(ident.problems.subsequentUnderscores);
        CHECK(ident.attributes.ignored);
    }
    SUBCASE("double underscore trailing") {
        auto ident = Ident::forText("x__");
        CHECK(ident.problems.subsequentUnderscores);
        CHECK(ident.attributes.reassignable);
    }
    SUBCASE("only underscores") {
        auto ident = Ident::forText("__");
        CHECK(ident.problems.subsequentUnderscores);
        CHECK(ident.attributes.ignored);
        CHECK(ident.attributes.reassignable);
    }
    SUBCASE("separated underscores") {
        auto ident = Ident::forText("_a_b_");
        CHECK(!ident.problems.hasProblems());
    }
}

TEST_CASE("Attributes packing") {
    for (uint8_t bits = 0; bits <= Attributes::kAllBits; ++bits) {
        auto attributes = Attributes::unpack(bits);
        CHECK_EQ(attributes.pack(), bits);
        CHECK_EQ(attributes.effectful, (bits & Attributes::kEffectfulBit) != 0);
        CHECK_EQ(attributes.ignored, (bits & Attributes::kIgnoredBit) != 0);
        CHECK_EQ(attributes.reassignable, (bits & Attributes::kReassignableBit) != 0);
    }
}

} // namespace canon
