#include "catch2_custom.hpp"

#include <junitgrader/java/file_searcher.hpp>

#include <catch2/matchers/catch_matchers.hpp>
#include <catch2/matchers/catch_matchers_range_equals.hpp>
#include <range/v3/algorithm/is_sorted.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

using Catch::Matchers::RangeEquals;
using Catch::Matchers::UnorderedRangeEquals;
using junitgrader::java::FileSearcher;

const auto resources_path = RESOURCES_PATH / "java_source";

const auto map_to_filename =
    ranges::views::transform([](const std::filesystem::path& path) { return path.filename().string(); }) |
    ranges::to<std::vector>();

TEST_CASE("Find java files by regex") {
    FileSearcher searcher{R"(.*\.java)"};

    const std::vector<std::string> expected_direct = {"AbstractShape.java",          "Concrete.java",
                                                      "Default.java",                "LatePackage.java",
                                                      "PackagePrivateAbstract.java", "SplitConcrete.java",
                                                      "SplitDeclaration.java"};

    const std::vector<std::string> expected_recursive = [vec = expected_direct]() mutable {
        vec.insert(vec.end(), {"Circle.java", "CircleTest.java", "Shape.java", "ShapeTest.java", "Misplaced.java",
                               "Dollar.java", "Packaged.java"});
        return vec;
    }();

    REQUIRE_THAT(expected_direct, UnorderedRangeEquals(searcher.search(resources_path) | map_to_filename));
    REQUIRE_THAT(expected_recursive, UnorderedRangeEquals(searcher.search_recursive(resources_path) | map_to_filename));
}

TEST_CASE("Find files by predicate") {
    FileSearcher searcher{[](std::string_view filename) { return filename.ends_with("Test.java"); }};

    REQUIRE_THAT(searcher.search_recursive(resources_path) | map_to_filename,
                 RangeEquals(std::vector<std::string>{"CircleTest.java", "ShapeTest.java"}));

    REQUIRE(searcher.search(resources_path).empty());
}

TEST_CASE("Search results are sorted by path") {
    FileSearcher searcher{".*"};

    auto results = searcher.search_recursive(resources_path);

    REQUIRE_FALSE(results.empty());
    REQUIRE(ranges::is_sorted(results));

    SECTION("Only regular files are found") {
        for (const auto& path : results) {
            REQUIRE(std::filesystem::is_regular_file(path));
        }
    }
}
