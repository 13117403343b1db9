#include "catch2_custom.hpp"

#include <junitgrader/java/compiler.hpp>
#include <junitgrader/java/java_source.hpp>
#include <junitgrader/runner/junit_runner.hpp>
#include <junitgrader/subprocess/run_result.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <stdlib.h>

using junitgrader::RunResult;
using junitgrader::java::CompiledPair;
using junitgrader::java::JavaSource;
using junitgrader::runner::JunitRunner;
using junitgrader::runner::TestOutcome;

namespace runner = junitgrader::runner;

namespace {

using namespace std::chrono_literals;

const auto reference_tests_path = RESOURCES_PATH / "reference-tests";
const auto repos_path = RESOURCES_PATH / "repos";

CompiledPair make_pair(const std::filesystem::path& test_class, const std::filesystem::path& prod_class) {
    return CompiledPair{.test_class = JavaSource{test_class}, .prod_class = JavaSource{prod_class}};
}

const JunitRunner fake_runner{FAKE_JUNIT_JAR.string(), 5s, FAKE_JAVA.string()};

} // namespace

TEST_CASE("Arguments to the java executable") {
    SECTION("Without a security policy") {
        REQUIRE(JunitRunner::build_args("se.FiboTest", "/a:/b:.", std::nullopt) ==
                std::vector<std::string>{"-enableassertions", "-cp", "/a:/b:.", "org.junit.runner.JUnitCore",
                                         "se.FiboTest"});
    }

    SECTION("With a security policy") {
        REQUIRE(JunitRunner::build_args("FiboTest", ".", "/tmp/policy") ==
                std::vector<std::string>{"-enableassertions", "-Djava.security.manager",
                                         "-Djava.security.policy==/tmp/policy", "-cp", ".",
                                         "org.junit.runner.JUnitCore", "FiboTest"});
    }
}

TEST_CASE("Outcome of a completed run") {
    auto passed = TestOutcome::completed("FiboTest", RunResult::make_exited(0), "OK (2 tests)\n");

    REQUIRE(passed.is_success());
    REQUIRE_FALSE(passed.is_timed_out());
    REQUIRE(passed.num_passed() == 2);
    REQUIRE(passed.num_failed() == 0);

    auto failed = TestOutcome::completed("FiboTest", RunResult::make_exited(1), "Tests run: 2,  Failures: 2\n");

    REQUIRE_FALSE(failed.is_success());
    REQUIRE(failed.num_passed() == 0);
    REQUIRE(failed.num_failed() == 2);
}

TEST_CASE("Outcome of a timed out run") {
    auto outcome = TestOutcome::timed_out("FiboTest", 1500ms);

    REQUIRE_FALSE(outcome.is_success());
    REQUIRE(outcome.is_timed_out());
    REQUIRE(outcome.num_passed() == 0);
    REQUIRE(outcome.num_failed() == 0);
    REQUIRE(outcome.failures().empty());
}

TEST_CASE("Run a passing test class") {
    TempDir tmp;
    const auto args_log = tmp.path() / "java-args";
    REQUIRE(::setenv("FAKE_JAVA_ARGS_LOG", args_log.c_str(), 1) == 0);

    const auto prod_dir = repos_path / "some-student-week-10" / "src";
    auto res = fake_runner.run(make_pair(reference_tests_path / "week-10" / "FiboTest.java", prod_dir / "Fibo.java"),
                               std::nullopt);

    REQUIRE(::unsetenv("FAKE_JAVA_ARGS_LOG") == 0);

    REQUIRE(res);
    REQUIRE(res->fqn == "FiboTest");
    REQUIRE(res->is_success());
    REQUIRE(res->num_passed() == 2);

    std::ifstream log{args_log};
    std::vector<std::string> args;
    for (std::string line; std::getline(log, line);) {
        args.push_back(line);
    }

    // Package roots of both classes are prepended to the base classpath
    REQUIRE(args == std::vector<std::string>{"-enableassertions", "-cp",
                                             fmt::format("{}:{}:{}:.", prod_dir.string(),
                                                         (reference_tests_path / "week-10").string(),
                                                         FAKE_JUNIT_JAR.string()),
                                             "org.junit.runner.JUnitCore", "FiboTest"});
}

TEST_CASE("Run a packaged test class") {
    auto res = fake_runner.run(
        make_pair(reference_tests_path / "week-12" / "se" / "repobee" / "fibo" / "FiboTest.java",
                  repos_path / "packaged-student-week-12" / "src" / "se" / "repobee" / "fibo" / "Fibo.java"),
        std::nullopt);

    REQUIRE(res);
    REQUIRE(res->fqn == "se.repobee.fibo.FiboTest");
    REQUIRE(res->num_passed() == 2);
}

TEST_CASE("Run a failing test class") {
    auto res = fake_runner.run(make_pair(reference_tests_path / "week-11" / "PrimeCheckerTest.java",
                                         repos_path / "failing-student-week-11" / "src" / "PrimeChecker.java"),
                               std::nullopt);

    REQUIRE(res);
    REQUIRE_FALSE(res->is_success());
    REQUIRE(res->num_passed() == 1);
    REQUIRE(res->num_failed() == 2);
    REQUIRE(res->failures() == std::vector<std::string>{
                                   "1) test1(PrimeCheckerTest)\n"
                                   "java.lang.AssertionError: expected:<true> but was:<false>",
                                   "2) test2(PrimeCheckerTest)\n"
                                   "java.lang.AssertionError: expected:<true> but was:<false>",
                               });
}

TEST_CASE("Java executable that cannot be started") {
    const JunitRunner runner{FAKE_JUNIT_JAR.string(), 5s, "/nonexistent/java"};
    const auto prod_dir = repos_path / "some-student-week-10" / "src";

    REQUIRE_THROWS_WITH(
        runner.run(make_pair(reference_tests_path / "week-10" / "FiboTest.java", prod_dir / "Fibo.java"), std::nullopt),
        "could not run FiboTest: failed to execute /nonexistent/java: No such file or directory");
}

TEST_CASE("Test class that runs for too long is timed out") {
    const JunitRunner runner{FAKE_JUNIT_JAR.string(), 300ms, FAKE_JAVA.string()};

    auto res = runner.run(make_pair(reference_tests_path / "week-10" / "FiboTest.java",
                                    repos_path / "timeout-week-10" / "src" / "Fibo.java"),
                          std::nullopt);

    REQUIRE(res);
    REQUIRE(*res == TestOutcome::timed_out("FiboTest", 300ms));
}

TEST_CASE("Directory structure must match the package") {
    auto res = fake_runner.run(
        make_pair(reference_tests_path / "week-12" / "se" / "repobee" / "fibo" / "FiboTest.java",
                  repos_path / "misplaced-package-week-12" / "src" / "se" / "fibo" / "Fibo.java"),
        std::nullopt);

    REQUIRE_FALSE(res);
    REQUIRE(res.error().severity == junitgrader::Severity::Error);
    REQUIRE_THAT(res.error().message,
                 Catch::Matchers::StartsWith("Directory structure does not conform to package statement."));
}

TEST_CASE("Test and production class must share a package") {
    auto res = fake_runner.run(make_pair(reference_tests_path / "week-10" / "FiboTest.java",
                                         repos_path / "packaged-student-week-12" / "src" / "se" / "repobee" / "fibo" /
                                             "Fibo.java"),
                               std::nullopt);

    REQUIRE_FALSE(res);
    REQUIRE(res.error().message ==
            "Test class FiboTest.java in package , but class Fibo.java in package se.repobee.fibo");
}
