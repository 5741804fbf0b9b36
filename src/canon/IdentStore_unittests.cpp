#include "canon/IdentStore.hpp"

#include "canon/ErrorReporter.hpp"

#include "doctest/doctest.h"
#include "fmt/format.h"

#include <string>
#include <unordered_set>
#include <vector>

namespace canon {

TEST_CASE("IdentStore insert") {
    SUBCASE("text round trip") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        std::vector<std::string> texts = {"x", "main!", "_ignored", "counter_", "a__b", "", "Éclair", "x"};
        std::vector<IdentIdx> handles;
        for (size_t i = 0; i < texts.size(); ++i) {
            handles.emplace_back(store.insert(texts[i], Region(i * 10, i * 10 + 5), &errorReporter));
        }
        REQUIRE_EQ(store.size(), texts.size());
        for (size_t i = 0; i < texts.size(); ++i) {
            REQUIRE(handles[i].isValid());
            CHECK_EQ(store.textOf(handles[i]), texts[i]);
            CHECK_EQ(store.regionOf(handles[i]), Region(i * 10, i * 10 + 5));
        }
        CHECK(errorReporter.ok());
    }
    SUBCASE("every insert is a new occurrence") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        auto first = store.insert("x", Region(0, 1), &errorReporter);
        auto second = store.insert("x", Region(4, 5), &errorReporter);
        CHECK_EQ(first.index(), 0);
        CHECK_EQ(second.index(), 1);
        CHECK_NE(first, second);
        CHECK_EQ(store.size(), 2);
        CHECK_EQ(store.interner().size(), 1);
        // Same spelling keeps separate regions.
        CHECK_EQ(store.regionOf(first), Region(0, 1));
        CHECK_EQ(store.regionOf(second), Region(4, 5));
    }
    SUBCASE("attributes in handle") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        auto effectful = store.insert("foo!", Region(), &errorReporter);
        CHECK(effectful.isEffectful());
        CHECK(!effectful.isIgnored());
        CHECK(!effectful.isReassignable());
        auto ignored = store.insert("_x", Region(), &errorReporter);
        CHECK(ignored.isIgnored());
        auto reassignable = store.insert("x_", Region(), &errorReporter);
        CHECK(reassignable.isReassignable());
        auto plain = store.insert("x", Region(), &errorReporter);
        CHECK_EQ(plain.attributes(), Attributes());
    }
    SUBCASE("style problems are reported but don't block") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        auto idx = store.insert("a__b", Region(7, 11), &errorReporter);
        REQUIRE(idx.isValid());
        CHECK_EQ(store.textOf(idx), "a__b");
        REQUIRE_EQ(errorReporter.problems().size(), 1);
        const auto& problem = errorReporter.problems()[0];
        CHECK_EQ(problem.kind, Problem::Kind::kIdentIssue);
        CHECK(problem.identProblems.subsequentUnderscores);
        CHECK_EQ(problem.region, Region(7, 11));
        CHECK(errorReporter.ok());
        CHECK_EQ(errorReporter.warningCount(), 1);

        store.insert("a__b", Region(20, 24), &errorReporter);
        CHECK_EQ(errorReporter.problems().size(), 2);
        store.insert("ab", Region(30, 32), &errorReporter);
        CHECK_EQ(errorReporter.problems().size(), 2);
    }
}

TEST_CASE("IdentStore sameText") {
    IdentStore store;
    ErrorReporter errorReporter(true);
    auto a = store.insert("name", Region(0, 4), &errorReporter);
    auto b = store.insert("name", Region(10, 14), &errorReporter);
    auto c = store.insert("Name", Region(20, 24), &errorReporter);
    auto d = store.insert("name!", Region(30, 35), &errorReporter);
    CHECK(store.sameText(a, a));
    CHECK(store.sameText(a, b));
    CHECK(store.sameText(b, a));
    CHECK(!store.sameText(a, c));
    CHECK(!store.sameText(a, d));

    // Attributes stripped or added don't change the text the handle points at.
    auto aWithAttributes = IdentIdx::make(a.index(), Attributes::unpack(Attributes::kAllBits));
    CHECK(store.sameText(aWithAttributes, b));
}

TEST_CASE("IdentStore lookup") {
    SUBCASE("missing text") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        store.insert("x", Region(), &errorReporter);
        auto occurrences = store.lookup("y");
        CHECK(occurrences.empty());
        CHECK_EQ(occurrences.size(), 0);
        CHECK(occurrences.begin() == occurrences.end());
    }
    SUBCASE("empty store") {
        IdentStore store;
        CHECK(store.lookup("x").empty());
    }
    SUBCASE("all occurrences in order") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        std::vector<IdentIdx> xs;
        std::vector<IdentIdx> others;
        for (uint32_t i = 0; i < 50; ++i) {
            if (i % 3 == 0) {
                xs.emplace_back(store.insert("x", Region(i, i + 1), &errorReporter));
            } else {
                others.emplace_back(store.insert(fmt::format("y{}", i % 4), Region(i, i + 2), &errorReporter));
            }
        }

        std::vector<IdentIdx> found;
        for (auto idx : store.lookup("x")) {
            found.emplace_back(idx);
        }
        CHECK_EQ(found, xs);
        CHECK_EQ(store.lookup("x").size(), xs.size());

        size_t othersFound = 0;
        for (const char* text : {"y0", "y1", "y2", "y3"}) {
            for (auto idx : store.lookup(text)) {
                CHECK_EQ(store.textOf(idx), text);
                ++othersFound;
            }
        }
        CHECK_EQ(othersFound, others.size());
    }
    SUBCASE("handles match those returned by insert") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        auto first = store.insert("go!", Region(0, 3), &errorReporter);
        store.insert("stop", Region(4, 8), &errorReporter);
        auto second = store.insert("go!", Region(9, 12), &errorReporter);

        auto occurrences = store.lookup("go!");
        std::unordered_set<IdentIdx> found(occurrences.begin(), occurrences.end());
        std::unordered_set<IdentIdx> expected({first, second});
        CHECK_EQ(found, expected);
        for (auto idx : occurrences) {
            CHECK(idx.isEffectful());
        }
    }
    SUBCASE("exact match only") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        store.insert("ab", Region(), &errorReporter);
        store.insert("abc", Region(), &errorReporter);
        store.insert("AB", Region(), &errorReporter);
        CHECK_EQ(store.lookup("ab").size(), 1);
        CHECK_EQ(store.lookup("a").size(), 0);
    }
}

TEST_CASE("IdentStore genUnique") {
    SUBCASE("decimal counter names") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        for (uint32_t i = 0; i < 1200; ++i) {
            auto idx = store.genUnique(Region(i, i), &errorReporter);
            REQUIRE(idx.isValid());
            CHECK_EQ(store.textOf(idx), fmt::format("{}", i));
            CHECK_EQ(idx.attributes(), Attributes());
            CHECK_EQ(store.regionOf(idx), Region(i, i));
            CHECK_EQ(store.exposingModuleOf(idx), kPrimaryModule);
        }
        CHECK_EQ(store.size(), 1200);
        CHECK_EQ(store.interner().size(), 1200);
        CHECK(errorReporter.problems().empty());
    }
    SUBCASE("first name is zero") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        auto idx = store.genUnique(Region(), &errorReporter);
        CHECK_EQ(store.textOf(idx), "0");
        CHECK_EQ(store.textOf(store.genUnique(Region(), &errorReporter)), "1");
    }
    SUBCASE("pairwise distinct") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        std::vector<IdentIdx> names;
        for (int i = 0; i < 100; ++i) {
            names.emplace_back(store.genUnique(Region(), &errorReporter));
        }
        for (size_t i = 0; i < names.size(); ++i) {
            for (size_t j = i + 1; j < names.size(); ++j) {
                CHECK(!store.sameText(names[i], names[j]));
            }
        }
    }
    SUBCASE("interleaved with insert") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        auto user = store.insert("x", Region(0, 1), &errorReporter);
        auto gen0 = store.genUnique(Region(2, 2), &errorReporter);
        store.insert("y", Region(3, 4), &errorReporter);
        auto gen1 = store.genUnique(Region(5, 5), &errorReporter);
        CHECK_EQ(user.index(), 0);
        CHECK_EQ(gen0.index(), 1);
        CHECK_EQ(gen1.index(), 3);
        CHECK_EQ(store.textOf(gen0), "0");
        CHECK_EQ(store.textOf(gen1), "1");
        CHECK_EQ(store.lookup("1").size(), 1);
    }
    SUBCASE("stores don't share counters") {
        IdentStore first;
        IdentStore second;
        ErrorReporter errorReporter(true);
        first.genUnique(Region(), &errorReporter);
        first.genUnique(Region(), &errorReporter);
        CHECK_EQ(second.textOf(second.genUnique(Region(), &errorReporter)), "0");
    }
}

TEST_CASE("IdentStore exposing module") {
    IdentStore store;
    ErrorReporter errorReporter(true);
    auto a = store.insert("List", Region(0, 4), &errorReporter);
    auto b = store.insert("List", Region(10, 14), &errorReporter);
    auto c = store.genUnique(Region(20, 20), &errorReporter);
    CHECK_EQ(store.exposingModuleOf(a), kPrimaryModule);
    CHECK_EQ(store.exposingModuleOf(b), kPrimaryModule);
    CHECK_EQ(store.exposingModuleOf(c), kPrimaryModule);

    store.setExposingModule(a, static_cast<ModuleIdx>(3));
    CHECK_EQ(store.exposingModuleOf(a), static_cast<ModuleIdx>(3));
    // Other occurrences of the same text keep their own module.
    CHECK_EQ(store.exposingModuleOf(b), kPrimaryModule);

    store.setExposingModule(c, static_cast<ModuleIdx>(9));
    CHECK_EQ(store.exposingModuleOf(c), static_cast<ModuleIdx>(9));
    CHECK_EQ(store.regionOf(c), Region(20, 20));
}

TEST_CASE("IdentStore capacity") {
    SUBCASE("default capacity") {
        IdentStore store;
        CHECK_EQ(store.capacity(), IdentIdx::kMaxOccurrences);
        CHECK_EQ(store.capacity(), (1u << 29) - 1);
    }
    SUBCASE("capacity clamped") {
        IdentStore store(0xffffffff);
        CHECK_EQ(store.capacity(), IdentIdx::kMaxOccurrences);
    }
    SUBCASE("insert past capacity") {
        IdentStore store(3);
        ErrorReporter errorReporter(true);
        for (uint32_t i = 0; i < 3; ++i) {
            REQUIRE(store.insert("x", Region(i, i + 1), &errorReporter).isValid());
        }
        REQUIRE(errorReporter.ok());

        auto overflow = store.insert("brand_new", Region(40, 49), &errorReporter);
        CHECK(!overflow.isValid());
        CHECK(!errorReporter.ok());
        CHECK_EQ(errorReporter.errorCount(), 1);
        REQUIRE_EQ(errorReporter.problems().size(), 1);
        CHECK_EQ(errorReporter.problems()[0].kind, Problem::Kind::kCapacityExceeded);
        CHECK(errorReporter.problems()[0].isFatal());
        CHECK_EQ(errorReporter.problems()[0].capacity, 3);
        CHECK_EQ(errorReporter.problems()[0].region, Region(40, 49));

        // Failed inserts leave no trace.
        CHECK_EQ(store.size(), 3);
        CHECK(store.lookup("brand_new").empty());
        CHECK_EQ(store.lookup("x").size(), 3);
    }
    SUBCASE("genUnique past capacity") {
        IdentStore store(1);
        ErrorReporter errorReporter(true);
        REQUIRE(store.genUnique(Region(), &errorReporter).isValid());
        CHECK(!store.genUnique(Region(), &errorReporter).isValid());
        CHECK_EQ(errorReporter.errorCount(), 1);
        CHECK_EQ(store.size(), 1);
    }
    SUBCASE("style warning still recorded on overflow") {
        IdentStore store(0);
        ErrorReporter errorReporter(true);
        CHECK(!store.insert("a__b", Region(), &errorReporter).isValid());
        CHECK_EQ(errorReporter.warningCount(), 1);
        CHECK_EQ(errorReporter.errorCount(), 1);
    }
}

} // namespace canon
