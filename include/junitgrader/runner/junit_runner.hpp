#pragma once

#include <junitgrader/grading_session.hpp>
#include <junitgrader/java/compiler.hpp>
#include <junitgrader/runner/junit_output.hpp>
#include <junitgrader/subprocess/run_result.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace junitgrader::runner {

/// The test class ran to completion
struct Completed
{
    /// The runner exited with status 0
    bool success;
    TestCounts counts;

    bool operator==(const Completed& rhs) const = default;
};

/// The test class was killed after running for `timeout`
struct TimedOut
{
    std::chrono::milliseconds timeout;

    bool operator==(const TimedOut& rhs) const = default;
};

using RunOutcome = std::variant<Completed, TimedOut>;

/// Result of running one test class
struct TestOutcome
{
    std::string fqn;
    RunOutcome outcome;

    static TestOutcome completed(std::string fqn, const RunResult& run_result, std::string_view output);
    static TestOutcome timed_out(std::string fqn, std::chrono::milliseconds timeout);

    bool is_success() const;
    bool is_timed_out() const { return std::holds_alternative<TimedOut>(outcome); }

    /// 0 for a timed out run
    int num_passed() const;

    /// 0 for a timed out run
    int num_failed() const;

    /// Empty for a timed out run
    const std::vector<std::string>& failures() const;

    bool operator==(const TestOutcome& rhs) const = default;
};

/// Runs compiled test classes with the JUnit 4 console runner, one JVM per test class
class JunitRunner
{
public:
    static constexpr std::string_view DEFAULT_JAVA = "java";
    static constexpr std::string_view JUNIT_RUNNER_MAIN = "org.junit.runner.JUnitCore";

    JunitRunner(std::string classpath, std::chrono::milliseconds timeout, std::string java = std::string{DEFAULT_JAVA});

    /// Runs the test class of `pair` with both package roots on the classpath.
    ///
    /// A test and production class that declare different packages are an error, as is a directory structure
    /// that does not match the package.
    GradingResult<TestOutcome> run(const java::CompiledPair& pair,
                                   const std::optional<std::filesystem::path>& security_policy) const;

    /// Arguments to the `java` executable for running `test_class_fqn`
    static std::vector<std::string> build_args(std::string_view test_class_fqn, std::string_view classpath,
                                               const std::optional<std::filesystem::path>& security_policy);

private:
    std::string classpath_;
    std::chrono::milliseconds timeout_;
    std::string java_;
};

} // namespace junitgrader::runner
