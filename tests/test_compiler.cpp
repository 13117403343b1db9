#include "catch2_custom.hpp"

#include <junitgrader/java/compiler.hpp>
#include <junitgrader/java/java_source.hpp>
#include <junitgrader/java/matcher.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <vector>

#include <stdlib.h>

using junitgrader::java::CompiledPair;
using junitgrader::java::CompileFailure;
using junitgrader::java::JavaSource;
using junitgrader::java::PairwiseCompiler;

namespace java = junitgrader::java;

namespace {

const auto reference_tests_path = RESOURCES_PATH / "reference-tests";
const auto repos_path = RESOURCES_PATH / "repos";

const JavaSource fibo_test{reference_tests_path / "week-10" / "FiboTest.java"};

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream file{path};
    std::vector<std::string> lines;
    for (std::string line; std::getline(file, line);) {
        lines.push_back(line);
    }
    return lines;
}

void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream file{path};
    file << contents;
}

} // namespace

TEST_CASE("Find production classes for a test class") {
    SECTION("Same name without the Test suffix") {
        auto candidates = java::find_java_files(repos_path / "some-student-week-10");
        auto prod = PairwiseCompiler::find_prod_classes(fibo_test, candidates);

        REQUIRE(prod.size() == 1);
        REQUIRE(prod.front().get_filename() == "Fibo.java");
    }

    SECTION("Production class must be in the same package") {
        const JavaSource packaged_test{reference_tests_path / "week-12" / "se" / "repobee" / "fibo" / "FiboTest.java"};

        REQUIRE(PairwiseCompiler::find_prod_classes(packaged_test,
                                                    java::find_java_files(repos_path / "some-student-week-10"))
                    .empty());
        REQUIRE(PairwiseCompiler::find_prod_classes(packaged_test,
                                                    java::find_java_files(repos_path / "packaged-student-week-12"))
                    .size() == 1);
    }

    SECTION("All duplicates are returned") {
        auto candidates = java::find_java_files(repos_path / "duplicate-prod-class-week-10");
        REQUIRE(PairwiseCompiler::find_prod_classes(fibo_test, candidates).size() == 2);
    }
}

TEST_CASE("Files compiled together for a test/production pair") {
    const auto dir = RESOURCES_PATH / "java_source" / "dir";

    auto files = PairwiseCompiler::files_to_compile(JavaSource{dir / "ShapeTest.java"}, JavaSource{dir / "Shape.java"});

    // Production files first, then test files, each sorted. Non-java files are never included
    REQUIRE(files == std::vector<std::filesystem::path>{dir / "Circle.java", dir / "Shape.java",
                                                        dir / "CircleTest.java", dir / "ShapeTest.java"});
}

TEST_CASE("Compile a test class with its production class") {
    PairwiseCompiler compiler{"/opt/junit.jar", FAKE_JAVAC.string()};

    SECTION("Successful compilation") {
        TempDir tmp;
        const auto args_log = tmp.path() / "javac-args";
        REQUIRE(::setenv("FAKE_JAVAC_ARGS_LOG", args_log.c_str(), 1) == 0);

        auto candidates = java::find_java_files(repos_path / "some-student-week-10");
        auto outcome = compiler.compile(fibo_test, candidates);

        REQUIRE(::unsetenv("FAKE_JAVAC_ARGS_LOG") == 0);

        REQUIRE(std::holds_alternative<CompiledPair>(outcome));
        REQUIRE(std::get<CompiledPair>(outcome).prod_class == candidates.front());

        auto args = read_lines(args_log);
        REQUIRE(args == std::vector<std::string>{"-cp", "/opt/junit.jar:.",
                                                 (repos_path / "some-student-week-10" / "src" / "Fibo.java").string(),
                                                 fibo_test.get_path().string()});
    }

    SECTION("Missing production class") {
        auto outcome = compiler.compile(fibo_test, java::find_java_files(repos_path / "no-prod-class-week-10"));

        REQUIRE(outcome == java::CompileOutcome{CompileFailure{.test_class_fqn = "FiboTest",
                                                               .message = "no production class found for FiboTest"}});
    }

    SECTION("Duplicate production classes") {
        auto outcome = compiler.compile(fibo_test, java::find_java_files(repos_path / "duplicate-prod-class-week-10"));

        REQUIRE(outcome ==
                java::CompileOutcome{CompileFailure{.test_class_fqn = "FiboTest",
                                                    .message = "multiple production classes found for FiboTest"}});
    }

    SECTION("Compile error reports the compiler output") {
        auto outcome = compiler.compile(fibo_test, java::find_java_files(repos_path / "compile-error-week-10"));

        REQUIRE(std::holds_alternative<CompileFailure>(outcome));
        const auto& failure = std::get<CompileFailure>(outcome);
        REQUIRE(failure.test_class_fqn == "FiboTest");
        REQUIRE_THAT(failure.message, Catch::Matchers::ContainsSubstring("error: cannot find symbol"));
        REQUIRE_THAT(failure.message, Catch::Matchers::EndsWith("1 error\n"));
    }
}

TEST_CASE("Compilation that does not finish in time is a failure") {
    TempDir tmp;
    std::filesystem::create_directories(tmp.path() / "src");
    write_file(tmp.path() / "src" / "Fibo.java", "// fake-javac: hang\npublic class Fibo {}\n");

    PairwiseCompiler compiler{"", FAKE_JAVAC.string(), std::chrono::seconds{1}};

    auto outcome = compiler.compile(fibo_test, java::find_java_files(tmp.path()));

    REQUIRE(outcome ==
            java::CompileOutcome{CompileFailure{.test_class_fqn = "FiboTest",
                                                .message = "Compilation of FiboTest timed out after 1 seconds"}});
}

TEST_CASE("Compile all test classes") {
    PairwiseCompiler compiler{"", FAKE_JAVAC.string()};

    SECTION("Abstract test classes are skipped") {
        auto tests = java::find_reference_test_classes(reference_tests_path, "week-14", {});
        REQUIRE(tests);

        auto results = compiler.compile_all(*tests, java::find_java_files(repos_path / "abstract-tests-week-14"));

        REQUIRE(results.failed.empty());
        REQUIRE(results.succeeded.size() == 1);
        REQUIRE(results.succeeded.front().test_class.get_filename() == "FiboTest.java");
    }

    SECTION("Failures and successes are separated") {
        const std::vector<JavaSource> tests{fibo_test, JavaSource{reference_tests_path / "week-11" /
                                                                  "PrimeCheckerTest.java"}};

        auto results = compiler.compile_all(tests, java::find_java_files(repos_path / "some-student-week-10"));

        REQUIRE(results.succeeded.size() == 1);
        REQUIRE(results.failed ==
                std::vector<CompileFailure>{{.test_class_fqn = "PrimeCheckerTest",
                                             .message = "no production class found for PrimeCheckerTest"}});
    }
}
