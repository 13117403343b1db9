#pragma once

#include <junitgrader/common/expected.hpp>
#include <junitgrader/output/report.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

/// Everything that configures a grading run. Constructed once per invocation, and never modified while repos are
/// being graded.
struct GraderOptions
{
    std::vector<std::string> assignment_names;
    std::filesystem::path reference_tests_dir;

    /// Filenames of reference test classes to skip
    std::vector<std::string> ignore_tests;

    std::optional<std::filesystem::path> hamcrest_path;
    std::optional<std::filesystem::path> junit_path;

    /// Value of the `CLASSPATH` environment variable
    std::string env_classpath;

    output::Verbosity verbosity = output::Verbosity::Normal;
    bool colorize = false;

    bool disable_security = false;

    /// Run the student's copies of the reference test classes instead of the reference test classes themselves
    bool run_student_tests = false;

    std::chrono::seconds timeout = DEFAULT_TIMEOUT;

    /// Compilation is unbounded when unset
    std::optional<std::chrono::seconds> compile_timeout;

    std::string javac_executable = std::string{DEFAULT_JAVAC};
    std::string java_executable = std::string{DEFAULT_JAVA};

    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{10};
    static constexpr std::string_view DEFAULT_JAVAC = "javac";
    static constexpr std::string_view DEFAULT_JAVA = "java";

    static constexpr std::string_view HAMCREST_JAR = "hamcrest-core-1.3.jar";
    static constexpr std::string_view JUNIT_JAR = "junit-4.12.jar";

    /// The classpath that every compiler and test runner invocation builds on:
    /// the JUnit and Hamcrest jars in front of the `CLASSPATH` environment variable.
    ///
    /// Logs a warning for each of the two jars that is neither configured nor on the `CLASSPATH`.
    std::string base_classpath() const;

    /// Verify that all fields are valid, returning a description of the first problem otherwise
    Expected<void, std::string> validate() const;
};

} // namespace junitgrader
