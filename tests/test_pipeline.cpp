#include "catch2_custom.hpp"

#include <junitgrader/junitgrader.hpp>

#include <chrono>
#include <filesystem>
#include <string>

using junitgrader::GraderOptions;
using junitgrader::RepoInfo;
using junitgrader::RepoPipeline;
using junitgrader::RepoResult;
using junitgrader::Severity;

namespace {

const auto repos_path = RESOURCES_PATH / "repos";

GraderOptions make_options() {
    GraderOptions options;

    options.assignment_names = {"week-10", "week-11", "week-12", "week-13", "week-14"};
    options.reference_tests_dir = RESOURCES_PATH / "reference-tests";
    options.junit_path = FAKE_JUNIT_JAR;
    options.hamcrest_path = FAKE_HAMCREST_JAR;
    options.javac_executable = FAKE_JAVAC.string();
    options.java_executable = FAKE_JAVA.string();
    options.timeout = std::chrono::seconds{5};

    return options;
}

RepoResult grade(const GraderOptions& options, const std::filesystem::path& repo_path) {
    return RepoPipeline{options}.grade(RepoInfo::from_path(repo_path));
}

RepoResult grade(const std::string& repo_name) {
    const GraderOptions options = make_options();
    return grade(options, repos_path / repo_name);
}

} // namespace

TEST_CASE("Repo info is named after the directory") {
    REQUIRE(RepoInfo::from_path("/repos/some-student-week-10").name == "some-student-week-10");
    REQUIRE(RepoInfo::from_path("/repos/some-student-week-10/").name == "some-student-week-10");
}

TEST_CASE("Grade a passing repo") {
    auto result = grade("some-student-week-10");

    REQUIRE(result.info.name == "some-student-week-10");
    REQUIRE(result.status == Severity::Success);
    REQUIRE(result.msg == "Test summary: Passed 2/2 of all executed tests\n"
                          "FiboTest: Passed 2/2 tests");
}

TEST_CASE("Grade a repo with failing tests") {
    auto result = grade("failing-student-week-11");

    REQUIRE(result.status == Severity::Warning);
    REQUIRE(result.msg == "Test summary: Passed 1/3 of all executed tests\n"
                          "PrimeCheckerTest: Passed 1/3 tests");

    SECTION("Verbose output includes the failures") {
        GraderOptions options = make_options();
        options.verbosity = junitgrader::output::Verbosity::Verbose;

        auto verbose_result = grade(options, repos_path / "failing-student-week-11");

        REQUIRE_THAT(verbose_result.msg, Catch::Matchers::ContainsSubstring(
                                             "1) test1(PrimeCheckerTest)\n"
                                             "java.lang.AssertionError: expected:<true> but was:<false>"));
        REQUIRE_THAT(verbose_result.msg, Catch::Matchers::ContainsSubstring("2) test2(PrimeCheckerTest)"));
    }
}

TEST_CASE("Grade a packaged repo") {
    auto result = grade("packaged-student-week-12");

    REQUIRE(result.status == Severity::Success);
    REQUIRE(result.msg == "Test summary: Passed 2/2 of all executed tests\n"
                          "se.repobee.fibo.FiboTest: Passed 2/2 tests");
}

TEST_CASE("Abstract reference tests are not run") {
    auto result = grade("abstract-tests-week-14");

    REQUIRE(result.status == Severity::Success);
    REQUIRE(result.msg == "Test summary: Passed 2/2 of all executed tests\n"
                          "FiboTest: Passed 2/2 tests");
}

TEST_CASE("Test class that runs for too long") {
    GraderOptions options = make_options();
    options.timeout = std::chrono::seconds{1};

    auto result = grade(options, repos_path / "timeout-week-10");

    REQUIRE(result.status == Severity::Warning);
    REQUIRE(result.msg == "Test summary: Passed 0/0 of all executed tests\n"
                          "FiboTest: Timed out after 1 seconds");
}

TEST_CASE("Compile failures are errors") {
    SECTION("Compile error") {
        auto result = grade("compile-error-week-10");
        const auto fibo_path = repos_path / "compile-error-week-10" / "src" / "Fibo.java";

        REQUIRE(result.status == Severity::Error);
        REQUIRE(result.msg == "Compile error: " + fibo_path.string() + ":5: error: cannot find symbol");
    }

    SECTION("Missing production class") {
        auto result = grade("no-prod-class-week-10");

        REQUIRE(result.status == Severity::Error);
        REQUIRE(result.msg == "Compile error: no production class found for FiboTest");
    }

    SECTION("Duplicate production classes") {
        auto result = grade("duplicate-prod-class-week-10");

        REQUIRE(result.status == Severity::Error);
        REQUIRE(result.msg == "Compile error: multiple production classes found for FiboTest");
    }
}

TEST_CASE("Production class in the wrong directory") {
    auto result = grade("misplaced-package-week-12");

    REQUIRE(result.status == Severity::Error);
    REQUIRE_THAT(result.msg, Catch::Matchers::StartsWith("Directory structure does not conform to package statement."));
}

TEST_CASE("Assignment without reference tests is a warning") {
    TempDir tmp;
    const auto repo_path = tmp.path() / "some-student-week-13";
    std::filesystem::create_directories(repo_path);

    const GraderOptions options = make_options();
    auto result = grade(options, repo_path);

    REQUIRE(result.status == Severity::Warning);
    REQUIRE_THAT(result.msg, Catch::Matchers::StartsWith("no files ending in `Test.java` found in"));
}

TEST_CASE("Repos that cannot be graded") {
    SECTION("Missing repo") {
        const auto repo_path = repos_path / "missing-student-week-10";
        auto result = grade("missing-student-week-10");

        REQUIRE(result.status == Severity::Error);
        REQUIRE(result.msg == "student repo " + repo_path.string() + " does not exist");
    }

    SECTION("Ambiguous assignment") {
        GraderOptions options = make_options();
        options.assignment_names = {"week-10", "10"};

        auto result = grade(options, repos_path / "two-assignments-week-10");

        REQUIRE(result.status == Severity::Error);
        REQUIRE(result.msg == "multiple matching assignment names: week-10, 10");
    }

    SECTION("Security policy without the JUnit jar") {
        GraderOptions options = make_options();
        options.junit_path.reset();

        auto result = grade(options, repos_path / "some-student-week-10");

        REQUIRE(result.status == Severity::Error);
        REQUIRE(result.msg == "junit4 jar not on the classpath");
    }
}

TEST_CASE("Unexpected faults while grading are errors") {
    GraderOptions options = make_options();
    options.java_executable = "/nonexistent/java";

    auto result = grade(options, repos_path / "some-student-week-10");

    // The repo result carries the exception's message as is
    REQUIRE(result.info.name == "some-student-week-10");
    REQUIRE(result.status == Severity::Error);
    REQUIRE(result.msg == "could not run FiboTest: failed to execute /nonexistent/java: No such file or directory");
}

TEST_CASE("Run the student's own test classes") {
    GraderOptions options = make_options();
    options.run_student_tests = true;

    SECTION("Matching test classes") {
        auto result = grade(options, repos_path / "student-with-tests-week-10");

        REQUIRE(result.status == Severity::Success);
        REQUIRE(result.msg == "Test summary: Passed 2/2 of all executed tests\n"
                              "FiboTest: Passed 2/2 tests");
    }

    SECTION("Missing test classes") {
        auto result = grade(options, repos_path / "student-without-tests-week-10");

        REQUIRE(result.status == Severity::Error);
        REQUIRE(result.msg == "Missing the following test classes in student repo: FiboTest.java");
    }

    SECTION("Duplicate test classes") {
        auto result = grade(options, repos_path / "student-with-duplicate-tests-week-10");

        REQUIRE(result.status == Severity::Error);
        REQUIRE(result.msg == "Duplicates of the following test classes found in student repo: FiboTest.java");
    }

    SECTION("Mismatching package") {
        auto result = grade(options, repos_path / "student-with-misnamed-package-week-10");

        REQUIRE(result.status == Severity::Error);
        REQUIRE_THAT(result.msg, Catch::Matchers::StartsWith("Package statement mismatch:"));
    }
}
