#include "canon/SourceFile.hpp"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace canon {

TEST_CASE("SourceFile read") {
    SUBCASE("missing file") {
        SourceFile sourceFile((fs::temp_directory_path() / "canon_missing_source_file.txt").string());
        CHECK(!sourceFile.read());
    }
    SUBCASE("directory path") {
        SourceFile sourceFile(fs::temp_directory_path().string());
        CHECK(!sourceFile.read());
    }
    SUBCASE("reads whole file") {
        auto path = fs::temp_directory_path() / "canon_source_file_unittest.txt";
        {
            std::ofstream outFile(path, std::ofstream::binary);
            outFile << "alpha\nbeta!\n";
        }
        SourceFile sourceFile(path.string());
        REQUIRE(sourceFile.read());
        CHECK(sourceFile.size() == 12);
        CHECK(sourceFile.codeView() == "alpha\nbeta!\n");
        fs::remove(path);
    }
}

} // namespace canon
