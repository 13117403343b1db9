#include <junitgrader/output/report.hpp>

#include <junitgrader/grading_session.hpp>
#include <junitgrader/java/compiler.hpp>
#include <junitgrader/runner/junit_runner.hpp>

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader::output {

namespace {

constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);

std::string style_str(std::string_view str, fmt::text_style style, bool colorize) {
    if (!colorize) {
        return std::string{str};
    }

    return fmt::format("{}", fmt::styled(str, style));
}

std::vector<std::string> split_lines(std::string_view str) {
    std::vector<std::string> lines;

    std::size_t start = 0;
    while (true) {
        std::size_t end = str.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(str.substr(start));
            return lines;
        }

        lines.emplace_back(str.substr(start, end - start));
        start = end + 1;
    }
}

std::string first_line(std::string_view str) {
    return std::string{str.substr(0, str.find('\n'))};
}

} // namespace

std::string truncate_lines(std::string_view str, std::size_t max_len, std::size_t max_lines) {
    if (max_len <= TRUNCATION_MARKER.size()) {
        throw std::invalid_argument(fmt::format("max_len must be greater than {}", TRUNCATION_MARKER.size()));
    }

    const std::size_t effective_len = max_len - TRUNCATION_MARKER.size();
    const std::size_t head_len = effective_len / 2;
    const std::size_t tail_len = effective_len - head_len;

    std::vector<std::string> lines = split_lines(str);

    for (std::string& line : lines) {
        if (line.size() > max_len) {
            line = fmt::format("{}{}{}", line.substr(0, head_len), TRUNCATION_MARKER,
                               line.substr(line.size() - tail_len));
        }
    }

    if (lines.size() > max_lines) {
        lines.resize(max_lines - 1);
        lines.emplace_back(TRUNCATION_MARKER);
    }

    return fmt::format("{}", fmt::join(lines, "\n"));
}

std::string test_result_header(std::string_view fqn, int num_tests, int num_passed, bool success,
                               std::optional<std::chrono::milliseconds> timeout, bool colorize) {
    std::string test_results;

    if (timeout) {
        test_results =
            fmt::format("Timed out after {} seconds", std::chrono::ceil<std::chrono::seconds>(*timeout).count());
    } else {
        test_results = fmt::format("Passed {}/{} tests", num_passed, num_tests);
    }

    return fmt::format("{}: {}", style_str(fqn, success ? SUCCESS_STYLE : WARNING_STYLE, colorize), test_results);
}

std::string pretty_result(const runner::TestOutcome& outcome, bool verbose, bool colorize) {
    std::optional<std::chrono::milliseconds> timeout;
    if (const auto* timed_out = std::get_if<runner::TimedOut>(&outcome.outcome)) {
        timeout = timed_out->timeout;
    }

    std::string msg = test_result_header(outcome.fqn, outcome.num_passed() + outcome.num_failed(),
                                         outcome.num_passed(), outcome.is_success(), timeout, colorize);

    if (!outcome.is_success() && verbose) {
        msg += fmt::format("\n{}", fmt::join(outcome.failures(), "\n"));
    }

    return msg;
}

std::string format_results(const std::vector<runner::TestOutcome>& test_outcomes,
                           const std::vector<java::CompileFailure>& compile_failures, Verbosity verbosity,
                           bool colorize) {
    using enum Verbosity;

    auto format_compile_failure = [&](const java::CompileFailure& failure) {
        std::string msg = fmt::format("{} {}", style_str("Compile error:", ERROR_STYLE, colorize), failure.message);

        switch (verbosity) {
        case VeryVerbose:
            return msg;
        case Verbose:
            return truncate_lines(msg);
        default:
            return first_line(msg);
        }
    };

    auto format_test_outcome = [&](const runner::TestOutcome& outcome) {
        std::string msg = pretty_result(outcome, verbosity != Normal, colorize);

        switch (verbosity) {
        case VeryVerbose:
            return msg;
        case Verbose:
            return truncate_lines(msg, DEFAULT_LINE_LENGTH_LIMIT, UNLIMITED_LINES);
        default:
            return first_line(msg);
        }
    };

    std::vector<std::string> entries = compile_failures | ranges::views::transform(format_compile_failure) |
                                       ranges::to<std::vector<std::string>>();

    for (const runner::TestOutcome& outcome : test_outcomes) {
        entries.push_back(format_test_outcome(outcome));
    }

    std::string msg = fmt::format("{}", fmt::join(entries, "\n"));

    if (test_outcomes.empty()) {
        return msg;
    }

    int num_passed = ranges::accumulate(test_outcomes | ranges::views::transform(&runner::TestOutcome::num_passed), 0);
    int num_failed = ranges::accumulate(test_outcomes | ranges::views::transform(&runner::TestOutcome::num_failed), 0);

    return fmt::format("Test summary: Passed {}/{} of all executed tests\n{}", num_passed, num_passed + num_failed,
                       msg);
}

Severity overall_severity(const std::vector<runner::TestOutcome>& test_outcomes,
                          const std::vector<java::CompileFailure>& compile_failures) {
    if (!compile_failures.empty()) {
        return Severity::Error;
    }

    if (!ranges::all_of(test_outcomes, &runner::TestOutcome::is_success)) {
        return Severity::Warning;
    }

    return Severity::Success;
}

} // namespace junitgrader::output
