#include <junitgrader/grader_options.hpp>

#include <junitgrader/common/expected.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/runner/security_policy.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

namespace {

std::optional<std::string> find_hamcrest_jar(std::string_view classpath) {
    static const std::regex HAMCREST_JAR_REGEX{R"([^:]*hamcrest-core-1\.3\.jar)"};

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(classpath.begin(), classpath.end(), match, HAMCREST_JAR_REGEX)) {
        return std::nullopt;
    }

    return match[0].str();
}

Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path) {
    if (!std::filesystem::is_regular_file(path)) {
        return fmt::format("{} is not a file", path.string());
    }

    return {};
}

Expected<void, std::string> ensure_positive(std::chrono::seconds duration, std::string_view name) {
    if (duration.count() <= 0) {
        return fmt::format("{} must be a positive number of seconds, but was: {}", name, duration.count());
    }

    return {};
}

} // namespace

std::string GraderOptions::base_classpath() const {
    auto warn_missing = [](std::string_view jar) {
        LOG_WARN("`{}` is not configured and not on the CLASSPATH variable. This will probably crash.", jar);
    };

    if (!hamcrest_path && !find_hamcrest_jar(env_classpath)) {
        warn_missing(HAMCREST_JAR);
    }
    if (!junit_path && !runner::find_junit_jar(env_classpath)) {
        warn_missing(JUNIT_JAR);
    }

    std::vector<std::string> entries;

    if (junit_path) {
        entries.push_back(junit_path->string());
    }
    if (hamcrest_path) {
        entries.push_back(hamcrest_path->string());
    }
    if (!env_classpath.empty()) {
        entries.push_back(env_classpath);
    }

    return fmt::format("{}", fmt::join(entries, ":"));
}

Expected<void, std::string> GraderOptions::validate() const {
    if (assignment_names.empty()) {
        return "no assignment names given";
    }

    if (!std::filesystem::is_directory(reference_tests_dir)) {
        return fmt::format("{} is not a directory", reference_tests_dir.string());
    }

    std::optional<std::filesystem::path> hamcrest_jar = hamcrest_path;
    if (!hamcrest_jar) {
        hamcrest_jar = find_hamcrest_jar(env_classpath);
    }

    std::optional<std::filesystem::path> junit_jar = junit_path;
    if (!junit_jar) {
        junit_jar = runner::find_junit_jar(env_classpath);
    }

    if (hamcrest_jar) {
        TRY(ensure_is_regular_file(*hamcrest_jar));
    }
    if (junit_jar) {
        TRY(ensure_is_regular_file(*junit_jar));
    }

    TRY(ensure_positive(timeout, "timeout"));

    if (compile_timeout) {
        TRY(ensure_positive(*compile_timeout, "compile timeout"));
    }

    return {};
}

} // namespace junitgrader
