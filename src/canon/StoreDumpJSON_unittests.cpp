#include "canon/StoreDumpJSON.hpp"

#include "canon/ErrorReporter.hpp"
#include "canon/IdentStore.hpp"

#include "doctest/doctest.h"
#include "rapidjson/document.h"

#include <string>

namespace canon {

TEST_CASE("StoreDumpJSON") {
    SUBCASE("empty store") {
        IdentStore store;
        StoreDumpJSON dumper;
        REQUIRE(dumper.dump(store, false));
        rapidjson::Document doc;
        doc.Parse(dumper.json().data(), dumper.json().size());
        REQUIRE(!doc.HasParseError());
        REQUIRE(doc["occurrences"].IsArray());
        CHECK(doc["occurrences"].Size() == 0);
        CHECK(doc["distinctTexts"].GetUint() == 0);
    }
    SUBCASE("occurrence fields") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        store.insert("print!", Region(0, 6), &errorReporter);
        auto second = store.insert("_x_", Region(7, 10), &errorReporter);
        store.insert("print!", Region(11, 17), &errorReporter);
        store.setExposingModule(second, static_cast<ModuleIdx>(4));

        StoreDumpJSON dumper;
        REQUIRE(dumper.dump(store, true));
        rapidjson::Document doc;
        doc.Parse(dumper.json().data(), dumper.json().size());
        REQUIRE(!doc.HasParseError());
        CHECK(doc["distinctTexts"].GetUint() == 2);

        const auto& occurrences = doc["occurrences"];
        REQUIRE(occurrences.Size() == 3);

        CHECK(occurrences[0]["index"].GetUint() == 0);
        CHECK(std::string(occurrences[0]["text"].GetString()) == "print!");
        CHECK(occurrences[0]["effectful"].GetBool());
        CHECK(!occurrences[0]["ignored"].GetBool());
        CHECK(!occurrences[0]["reassignable"].GetBool());
        CHECK(occurrences[0]["region"]["start"].GetUint() == 0);
        CHECK(occurrences[0]["region"]["end"].GetUint() == 6);
        CHECK(occurrences[0]["exposingModule"].GetUint() == 0);

        CHECK(occurrences[1]["index"].GetUint() == 1);
        CHECK(std::string(occurrences[1]["text"].GetString()) == "_x_");
        CHECK(!occurrences[1]["effectful"].GetBool());
        CHECK(occurrences[1]["ignored"].GetBool());
        CHECK(occurrences[1]["reassignable"].GetBool());
        CHECK(occurrences[1]["exposingModule"].GetUint() == 4);

        CHECK(occurrences[2]["region"]["start"].GetUint() == 11);
    }
    SUBCASE("dump twice") {
        IdentStore store;
        ErrorReporter errorReporter(true);
        store.insert("a", Region(0, 1), &errorReporter);
        StoreDumpJSON dumper;
        REQUIRE(dumper.dump(store, false));
        std::string first(dumper.json());
        store.insert("b", Region(2, 3), &errorReporter);
        REQUIRE(dumper.dump(store, false));
        CHECK(std::string(dumper.json()) != first);

        rapidjson::Document doc;
        doc.Parse(dumper.json().data(), dumper.json().size());
        REQUIRE(!doc.HasParseError());
        CHECK(doc["occurrences"].Size() == 2);
    }
}

} // namespace canon
