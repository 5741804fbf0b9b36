#include "canon/IdentIdx.hpp"

#include "doctest/doctest.h"

#include <unordered_set>

namespace canon {

TEST_CASE("IdentIdx packing") {
    SUBCASE("all attribute combinations") {
        for (uint8_t bits = 0; bits <= Attributes::kAllBits; ++bits) {
            auto attributes = Attributes::unpack(bits);
            auto idx = IdentIdx::make(12345, attributes);
            REQUIRE(idx.isValid());
            CHECK_EQ(idx.index(), 12345);
            CHECK_EQ(idx.attributes(), attributes);
            CHECK_EQ(idx.isEffectful(), attributes.effectful);
            CHECK_EQ(idx.isIgnored(), attributes.ignored);
            CHECK_EQ(idx.isReassignable(), attributes.reassignable);
        }
    }
    SUBCASE("index extremes") {
        auto zero = IdentIdx::make(0, Attributes::unpack(Attributes::kAllBits));
        CHECK_EQ(zero.index(), 0);
        CHECK_EQ(zero.asBits(), 0x7);

        auto largest = IdentIdx::make(IdentIdx::kMaxOccurrences - 1, Attributes());
        REQUIRE(largest.isValid());
        CHECK_EQ(largest.index(), (1u << 29) - 2);
        CHECK_EQ(largest.attributes(), Attributes());
    }
    SUBCASE("index does not bleed into attributes") {
        auto idx = IdentIdx::make(0x1ffffff0, Attributes::unpack(Attributes::kIgnoredBit));
        CHECK_EQ(idx.index(), 0x1ffffff0);
        CHECK(!idx.isEffectful());
        CHECK(idx.isIgnored());
        CHECK(!idx.isReassignable());
    }
    SUBCASE("bits round trip") {
        auto idx = IdentIdx::make(77, Attributes::unpack(Attributes::kEffectfulBit | Attributes::kReassignableBit));
        CHECK_EQ(IdentIdx::makeFromBits(idx.asBits()), idx);
    }
}

TEST_CASE("IdentIdx invalid") {
    CHECK(!IdentIdx().isValid());
    CHECK(!IdentIdx::makeInvalid().isValid());
    CHECK_EQ(IdentIdx(), IdentIdx::makeInvalid());
    CHECK_EQ(IdentIdx::makeInvalid().index(), IdentIdx::kInvalidIndex);
}

TEST_CASE("IdentIdx equality and hashing") {
    auto plain = IdentIdx::make(3, Attributes());
    auto effectful = IdentIdx::make(3, Attributes::unpack(Attributes::kEffectfulBit));
    CHECK_EQ(plain, IdentIdx::make(3, Attributes()));
    CHECK_NE(plain, effectful);
    CHECK_NE(plain, IdentIdx::make(4, Attributes()));

    std::unordered_set<IdentIdx> handles;
    handles.emplace(plain);
    handles.emplace(effectful);
    handles.emplace(IdentIdx::make(3, Attributes()));
    CHECK_EQ(handles.size(), 2);
}

} // namespace canon
