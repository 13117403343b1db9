#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace junitgrader::runner {

/// Counts parsed from the textual summary that JUnit 4's console runner prints to stdout
struct TestCounts
{
    int num_passed{};
    int num_failed{};

    /// One entry per numbered failure (`N) testName(Class)` plus its message lines), without stack frames
    std::vector<std::string> failures;

    bool operator==(const TestCounts& rhs) const = default;
};

/// `Failures: N`, or 0 if absent
int parse_num_failed(std::string_view output);

/// `Tests run: N`, or 0 if absent
int parse_num_tests_run(std::string_view output);

/// `OK (N tests)` if present. Otherwise there were failures, and the result is `Tests run` minus `Failures`
int parse_num_passed(std::string_view output);

/// Extracts each numbered failure block. A block is its header line followed by every line up to, but excluding,
/// the first one that starts with whitespace followed by `at` (the first stack frame).
std::vector<std::string> parse_failures(std::string_view output);

TestCounts parse_junit_output(std::string_view output);

} // namespace junitgrader::runner
