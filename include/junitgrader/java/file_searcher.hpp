#pragma once

#include <filesystem>
#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader::java {

/// Finds regular files whose filename matches a regular expression.
/// Results are always sorted by path.
class FileSearcher
{
public:
    explicit FileSearcher(std::string expr);

    /// Matches filenames with a predicate instead of a regular expression
    explicit FileSearcher(std::function<bool(std::string_view)> predicate);

    /// Search only the direct children of `base`
    std::vector<std::filesystem::path> search(const std::filesystem::path& base) const;

    std::vector<std::filesystem::path> search_recursive(const std::filesystem::path& base) const;

private:
    template <typename DirectoryIterator>
    std::vector<std::filesystem::path> search_impl(const std::filesystem::path& base) const;

    bool does_match(std::string_view filename) const;

    std::function<bool(std::string_view)> predicate_;
};

} // namespace junitgrader::java
