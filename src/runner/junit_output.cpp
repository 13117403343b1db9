#include <junitgrader/runner/junit_output.hpp>

#include <junitgrader/logging.hpp>

#include <range/v3/algorithm/find_if_not.hpp>

#include <cctype>
#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace junitgrader::runner {

namespace {

/// Returns the first capture group of `regex` in `output` as an integer, or nullopt if it does not match
std::optional<int> search_int(std::string_view output, const std::regex& regex) {
    std::match_results<std::string_view::const_iterator> match;

    if (!std::regex_search(output.begin(), output.end(), match, regex)) {
        return std::nullopt;
    }

    return std::stoi(match[1].str());
}

bool is_space(char chr) {
    return std::isspace(static_cast<unsigned char>(chr)) != 0;
}

/// Whether the text starting at `rest` begins with whitespace (possibly spanning lines) followed by `at`
bool starts_with_stack_frame(std::string_view rest) {
    auto after_space = ranges::find_if_not(rest, is_space);

    return after_space != rest.begin() && std::string_view{after_space, rest.end()}.starts_with("at");
}

struct Line
{
    std::string_view text;
    std::size_t offset;
};

std::vector<Line> split_lines(std::string_view output) {
    std::vector<Line> lines;

    std::size_t start = 0;
    while (start <= output.size()) {
        std::size_t end = output.find('\n', start);
        if (end == std::string_view::npos) {
            end = output.size();
        }

        lines.push_back({.text = output.substr(start, end - start), .offset = start});
        start = end + 1;
    }

    return lines;
}

} // namespace

int parse_num_failed(std::string_view output) {
    static const std::regex FAILURES_REGEX{R"(Failures: (\d+))"};

    return search_int(output, FAILURES_REGEX).value_or(0);
}

int parse_num_tests_run(std::string_view output) {
    static const std::regex TESTS_RUN_REGEX{R"(Tests run: (\d+))"};

    return search_int(output, TESTS_RUN_REGEX).value_or(0);
}

int parse_num_passed(std::string_view output) {
    // JUnit writes "OK (1 test)" for a single test
    static const std::regex OK_REGEX{R"(OK \((\d+) tests?\))"};

    if (auto num_ok = search_int(output, OK_REGEX)) {
        return *num_ok;
    }

    return parse_num_tests_run(output) - parse_num_failed(output);
}

std::vector<std::string> parse_failures(std::string_view output) {
    static const std::regex HEADER_REGEX{R"(^\d+\) )"};

    const std::vector<Line> lines = split_lines(output);
    std::vector<std::string> failures;

    std::size_t i = 0;
    while (i < lines.size()) {
        const Line& header = lines[i];

        if (!std::regex_search(header.text.begin(), header.text.end(), HEADER_REGEX)) {
            i++;
            continue;
        }

        std::string block{header.text};

        i++;
        while (i < lines.size() && !starts_with_stack_frame(output.substr(lines[i].offset))) {
            block += '\n';
            block += lines[i].text;
            i++;
        }

        failures.push_back(std::move(block));
    }

    LOG_TRACE("Parsed {} failure blocks", failures.size());

    return failures;
}

TestCounts parse_junit_output(std::string_view output) {
    return TestCounts{.num_passed = parse_num_passed(output),
                      .num_failed = parse_num_failed(output),
                      .failures = parse_failures(output)};
}

} // namespace junitgrader::runner
