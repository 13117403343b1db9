#pragma once

#include <junitgrader/grading_session.hpp>
#include <junitgrader/java/compiler.hpp>
#include <junitgrader/runner/junit_runner.hpp>

#include <chrono>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader::output {

/// How much of each failure is shown
enum class Verbosity {
    Normal,     ///< First line of every entry only
    Verbose,    ///< Failure details, with long lines and long compile errors truncated
    VeryVerbose ///< Everything, never truncated
};

constexpr std::string_view format_as(Verbosity verbosity) {
    switch (verbosity) {
    case Verbosity::Normal:
        return "Normal";
    case Verbosity::Verbose:
        return "Verbose";
    case Verbosity::VeryVerbose:
        return "VeryVerbose";
    default:
        return "<unknown>";
    }
}

inline constexpr std::size_t DEFAULT_LINE_LENGTH_LIMIT = 150;
inline constexpr std::size_t DEFAULT_MAX_LINES = 5;
inline constexpr std::size_t UNLIMITED_LINES = std::numeric_limits<std::size_t>::max();
inline constexpr std::string_view TRUNCATION_MARKER = " #[...]# ";

/// Shortens every line longer than `max_len` to exactly `max_len` characters by replacing its middle with
/// TRUNCATION_MARKER. If there are more than `max_lines` lines, keeps the first `max_lines - 1` and appends
/// TRUNCATION_MARKER as the last line.
///
/// Throws std::invalid_argument unless `max_len` is greater than the length of TRUNCATION_MARKER.
std::string truncate_lines(std::string_view str, std::size_t max_len = DEFAULT_LINE_LENGTH_LIMIT,
                           std::size_t max_lines = DEFAULT_MAX_LINES);

/// `<fqn>: Passed X/Y tests`, or `<fqn>: Timed out after N seconds`
std::string test_result_header(std::string_view fqn, int num_tests, int num_passed, bool success,
                               std::optional<std::chrono::milliseconds> timeout, bool colorize);

/// The header of `outcome`, followed by its failure descriptions when `verbose` and the run was unsuccessful
std::string pretty_result(const runner::TestOutcome& outcome, bool verbose, bool colorize);

/// Renders all compile failures, then all test outcomes, one entry each. If any test class ran, the entries are
/// preceded by `Test summary: Passed P/T of all executed tests`.
std::string format_results(const std::vector<runner::TestOutcome>& test_outcomes,
                           const std::vector<java::CompileFailure>& compile_failures, Verbosity verbosity,
                           bool colorize);

/// ERROR if anything failed to compile, otherwise WARNING if any test class failed or timed out
Severity overall_severity(const std::vector<runner::TestOutcome>& test_outcomes,
                          const std::vector<java::CompileFailure>& compile_failures);

} // namespace junitgrader::output
