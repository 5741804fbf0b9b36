#include "canon/Interner.hpp"

#include "canon/Hash.hpp"

#include "doctest/doctest.h"
#include "fmt/format.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace {

// Finds |count| distinct decimal texts with the same hash, so they share one interner bucket. Three-way collisions
// of a 32-bit hash show up within a few million texts, the search doubles its range until one does.
std::vector<std::string> findCollidingTexts(size_t count) {
    for (uint32_t limit = 1u << 22; limit <= (1u << 25); limit <<= 1) {
        std::vector<canon::Hash> hashes;
        hashes.reserve(limit);
        for (uint32_t i = 0; i < limit; ++i) {
            fmt::format_int text(i);
            hashes.emplace_back(canon::hash(std::string_view(text.data(), text.size())));
        }
        std::sort(hashes.begin(), hashes.end());

        for (size_t i = 0; i + count <= hashes.size(); ++i) {
            if (hashes[i] != hashes[i + count - 1]) {
                continue;
            }
            std::vector<std::string> texts;
            for (uint32_t j = 0; j < limit && texts.size() < count; ++j) {
                fmt::format_int text(j);
                std::string_view view(text.data(), text.size());
                if (canon::hash(view) == hashes[i]) {
                    texts.emplace_back(view);
                }
            }
            return texts;
        }
    }
    return std::vector<std::string>();
}

// The search is slow enough to only run once for every subcase.
const std::vector<std::string>& collidingTexts() {
    static const std::vector<std::string> texts = findCollidingTexts(3);
    return texts;
}

} // namespace

namespace canon {

TEST_CASE("Interner insert") {
    SUBCASE("empty interner") {
        Interner interner;
        CHECK_EQ(interner.size(), 0);
        CHECK_EQ(interner.textBytes(), 0);
        CHECK(!interner.lookup("x"));
    }
    SUBCASE("dedup") {
        Interner interner;
        auto a = interner.insert("alpha");
        auto b = interner.insert("beta");
        auto a2 = interner.insert("alpha");
        CHECK_EQ(a, a2);
        CHECK_NE(a, b);
        CHECK_EQ(interner.size(), 2);
        CHECK_EQ(interner.textBytes(), 9);
        CHECK_EQ(interner.textOf(a), "alpha");
        CHECK_EQ(interner.textOf(b), "beta");
    }
    SUBCASE("case sensitive") {
        Interner interner;
        auto lower = interner.insert("foo");
        auto upper = interner.insert("Foo");
        CHECK_NE(lower, upper);
        CHECK(!interner.sameText(lower, upper));
    }
    SUBCASE("copies text") {
        Interner interner;
        std::string source("transient");
        auto idx = interner.insert(source);
        CHECK_NE(static_cast<const void*>(interner.textOf(idx).data()), static_cast<const void*>(source.data()));
        source[0] = 'T';
        CHECK_EQ(interner.textOf(idx), "transient");
    }
    SUBCASE("empty text") {
        Interner interner;
        auto empty = interner.insert("");
        CHECK_EQ(interner.insert(""), empty);
        CHECK_EQ(interner.textOf(empty), "");
        REQUIRE(interner.lookup(""));
        CHECK_EQ(*interner.lookup(""), empty);
    }
    SUBCASE("embedded zero bytes") {
        Interner interner;
        std::string withZero("a\0b", 3);
        auto idx = interner.insert(withZero);
        CHECK_NE(idx, interner.insert("a"));
        CHECK_EQ(interner.textOf(idx), std::string_view(withZero));
    }
}

TEST_CASE("Interner text stays put") {
    Interner interner;
    std::vector<std::string_view> views;
    // Enough text to fill several chunks, plus one text larger than a chunk.
    for (int i = 0; i < 5000; ++i) {
        views.emplace_back(interner.textOf(interner.insert(fmt::format("identifier_number_{}", i))));
    }
    std::string huge(Interner::kChunkSize * 2, 'z');
    auto hugeIdx = interner.insert(huge);
    views.emplace_back(interner.textOf(hugeIdx));
    for (int i = 5000; i < 6000; ++i) {
        views.emplace_back(interner.textOf(interner.insert(fmt::format("identifier_number_{}", i))));
    }

    REQUIRE_EQ(interner.size(), 6001);
    for (int i = 0; i < 5000; ++i) {
        CHECK_EQ(views[i], fmt::format("identifier_number_{}", i));
        CHECK_EQ(static_cast<const void*>(views[i].data()),
                 static_cast<const void*>(interner.textOf(static_cast<Interner::TextIdx>(i)).data()));
    }
    CHECK_EQ(views[5000], huge);
    CHECK_EQ(static_cast<const void*>(views[5000].data()), static_cast<const void*>(interner.textOf(hugeIdx).data()));
    CHECK_EQ(views.back(), "identifier_number_5999");
}

TEST_CASE("Interner lookup") {
    Interner interner;
    auto x = interner.insert("x");
    auto y = interner.insert("y");
    auto foundX = interner.lookup("x");
    REQUIRE(foundX);
    CHECK_EQ(*foundX, x);
    auto foundY = interner.lookup("y");
    REQUIRE(foundY);
    CHECK_EQ(*foundY, y);
    CHECK(!interner.lookup("z"));
    CHECK(!interner.lookup("X"));
    CHECK(!interner.lookup("xx"));
    // Lookup never inserts.
    CHECK_EQ(interner.size(), 2);
}

TEST_CASE("Interner many distinct texts") {
    Interner interner;
    for (int i = 0; i < 20000; ++i) {
        CHECK_EQ(interner.insert(fmt::format("{}", i)), static_cast<Interner::TextIdx>(i));
    }
    for (int i = 0; i < 20000; ++i) {
        auto found = interner.lookup(fmt::format("{}", i));
        REQUIRE(found);
        CHECK_EQ(*found, static_cast<Interner::TextIdx>(i));
    }
}

TEST_CASE("Interner hash collisions") {
    const auto& texts = collidingTexts();
    REQUIRE_EQ(texts.size(), 3);
    REQUIRE_EQ(hash(texts[0]), hash(texts[1]));
    REQUIRE_EQ(hash(texts[1]), hash(texts[2]));
    REQUIRE_NE(texts[0], texts[1]);
    REQUIRE_NE(texts[1], texts[2]);

    SUBCASE("two texts in one bucket") {
        Interner interner;
        auto first = interner.insert(texts[0]);
        auto second = interner.insert(texts[1]);
        CHECK_NE(first, second);
        CHECK(!interner.sameText(first, second));
        CHECK_EQ(interner.size(), 2);
        CHECK_EQ(interner.textOf(first), texts[0]);
        CHECK_EQ(interner.textOf(second), texts[1]);

        auto foundFirst = interner.lookup(texts[0]);
        REQUIRE(foundFirst);
        CHECK_EQ(*foundFirst, first);
        auto foundSecond = interner.lookup(texts[1]);
        REQUIRE(foundSecond);
        CHECK_EQ(*foundSecond, second);

        CHECK_EQ(interner.insert(texts[1]), second);
        CHECK_EQ(interner.insert(texts[0]), first);
        CHECK_EQ(interner.size(), 2);
    }
    SUBCASE("third text chains on to the end") {
        Interner interner;
        auto first = interner.insert(texts[0]);
        auto unrelated = interner.insert("unrelated");
        auto second = interner.insert(texts[1]);
        auto third = interner.insert(texts[2]);
        CHECK_NE(third, first);
        CHECK_NE(third, second);
        CHECK_NE(third, unrelated);
        CHECK_EQ(interner.size(), 4);

        for (size_t i = 0; i < texts.size(); ++i) {
            auto found = interner.lookup(texts[i]);
            REQUIRE(found);
            CHECK_EQ(interner.textOf(*found), texts[i]);
        }
        CHECK_EQ(*interner.lookup(texts[2]), third);

        // Re-inserting walks the chain from either end without adding entries.
        CHECK_EQ(interner.insert(texts[2]), third);
        CHECK_EQ(interner.insert(texts[1]), second);
        CHECK_EQ(interner.insert(texts[0]), first);
        CHECK_EQ(interner.size(), 4);
    }
    SUBCASE("lookup misses a colliding text never inserted") {
        Interner interner;
        auto first = interner.insert(texts[0]);
        CHECK(!interner.lookup(texts[1]));
        CHECK(!interner.lookup(texts[2]));
        REQUIRE(interner.lookup(texts[0]));
        CHECK_EQ(*interner.lookup(texts[0]), first);
        CHECK_EQ(interner.size(), 1);
    }
}

} // namespace canon
