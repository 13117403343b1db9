#include <junitgrader/java/java_source.hpp>

#include <junitgrader/grading_session.hpp>
#include <junitgrader/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/take_last.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace junitgrader::java {

namespace {

std::ifstream open_source_file(const std::filesystem::path& file) {
    std::ifstream in_file{file};

    if (!in_file.is_open()) {
        throw std::runtime_error(fmt::format("failed to open source file {}", file.string()));
    }

    return in_file;
}

/// Escape all characters with a special meaning in an ECMAScript regex
std::string regex_escape(std::string_view str) {
    static constexpr std::string_view SPECIAL_CHARS = R"(\^$.|?*+()[]{})";

    std::string result;
    result.reserve(str.size());

    for (char chr : str) {
        if (SPECIAL_CHARS.find(chr) != std::string_view::npos) {
            result += '\\';
        }
        result += chr;
    }

    return result;
}

std::vector<std::string> split_package(std::string_view package) {
    if (package.empty()) {
        return {};
    }

    const std::string package_str{package};

    return package_str | ranges::views::split('.') | ranges::to<std::vector<std::string>>();
}

} // namespace

std::string extract_package(const std::filesystem::path& file) {
    // `$` is a valid character for a Java identifier
    static const std::regex PACKAGE_REGEX{R"(^\s*?package\s+([\w$][\w$]*(\.[\w$][\w$]*)*);)"};

    std::ifstream in_file = open_source_file(file);

    std::string first_line;
    std::getline(in_file, first_line);

    std::smatch match;
    if (std::regex_search(first_line, match, PACKAGE_REGEX)) {
        return match[1].str();
    }

    return "";
}

bool is_abstract_class(const std::filesystem::path& file) {
    // Searched over the whole file; the declaration may span lines, e.g. `public abstract\nclass Foo`
    const std::regex abstract_regex{R"(^\s*?(public\s+)?abstract\s+class\s+)" + regex_escape(file.stem().string()),
                                    std::regex::ECMAScript | std::regex::multiline};

    std::ifstream in_file = open_source_file(file);
    const std::string contents{std::istreambuf_iterator<char>{in_file}, std::istreambuf_iterator<char>{}};

    return std::regex_search(contents, abstract_regex);
}

std::string fully_qualified_name(std::string_view package, std::string_view simple_name) {
    if (package.empty()) {
        return std::string{simple_name};
    }

    return fmt::format("{}.{}", package, simple_name);
}

std::string fqn_from_file(const std::filesystem::path& file) {
    if (!is_source_file(file)) {
        throw std::invalid_argument(fmt::format("{} not a path to a {} file", file.string(), SOURCE_EXTENSION));
    }

    return fully_qualified_name(extract_package(file), file.stem().string());
}

bool is_source_file(const std::filesystem::path& file) {
    return file.extension() == SOURCE_EXTENSION;
}

bool is_test_class_file(const std::filesystem::path& file) {
    return file.filename().string().ends_with(TEST_CLASS_SUFFIX);
}

GradingResult<std::filesystem::path> package_root(const std::filesystem::path& file, std::string_view package) {
    const std::filesystem::path parent = file.parent_path();
    const std::vector<std::string> segments = split_package(package);

    std::vector<std::string> parent_components;
    for (const std::filesystem::path& part : parent) {
        parent_components.push_back(part.string());
    }

    const auto num_segments = gsl::narrow_cast<std::ptrdiff_t>(segments.size());

    // Compare component-wise, so that e.g. `xfoo/bar` does not count as ending in `foo/bar`
    bool conforms = parent_components.size() >= segments.size() &&
                    ranges::equal(segments, parent_components | ranges::views::take_last(num_segments));

    if (!conforms) {
        return make_grading_error(fmt::format(
            "Directory structure does not conform to package statement. Dir: '{}' Package: '{}'", parent.string(),
            package));
    }

    std::filesystem::path root = parent;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        root = root.parent_path();
    }

    return root;
}

std::string build_classpath(const std::vector<std::string>& paths, std::string_view base) {
    std::string classpath{base};

    for (const std::string& path : paths) {
        classpath = classpath.empty() ? path : fmt::format("{}{}{}", path, CLASSPATH_SEPARATOR, classpath);
    }

    if (classpath.empty()) {
        return ".";
    }

    return fmt::format("{}{}.", classpath, CLASSPATH_SEPARATOR);
}

JavaSource::JavaSource(std::filesystem::path path)
    : path_{std::filesystem::absolute(std::move(path)).lexically_normal()} {}

} // namespace junitgrader::java
