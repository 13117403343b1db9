/// \file
/// Defines data classes to store result data for the current run session
#pragma once

#include <junitgrader/common/expected.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

/// Ordered from least to most severe, so that the overall status of a repo is the max of its parts
enum class Severity { Success, Warning, Error };

constexpr std::string_view format_as(Severity severity) {
    switch (severity) {
    case Severity::Success:
        return "SUCCESS";
    case Severity::Warning:
        return "WARNING";
    case Severity::Error:
        return "ERROR";
    default:
        return "<unknown>";
    }
}

/// A condition that stops grading of a single repo early.
/// Carries the finished result message, so the repo boundary can report it as-is.
struct GradingError
{
    Severity severity;
    std::string message;

    bool operator==(const GradingError& rhs) const = default;
};

inline GradingError make_grading_error(std::string message) {
    return GradingError{.severity = Severity::Error, .message = std::move(message)};
}

inline GradingError make_grading_warning(std::string message) {
    return GradingError{.severity = Severity::Warning, .message = std::move(message)};
}

template <typename T>
using GradingResult = Expected<T, GradingError>;

/// A student repository to grade. The name is used to resolve the assignment.
struct RepoInfo
{
    std::string name;
    std::filesystem::path path;

    static RepoInfo from_path(const std::filesystem::path& path) {
        // A trailing slash would give an empty filename
        std::filesystem::path normalized = path.lexically_normal();
        if (!normalized.has_filename()) {
            normalized = normalized.parent_path();
        }

        return RepoInfo{.name = normalized.filename().string(), .path = path};
    }
};

/// Outcome of grading a single repository
struct RepoResult
{
    RepoInfo info;
    Severity status;
    std::string msg;
};

struct MultiRepoResult
{
    std::vector<RepoResult> results;

    std::size_t num_with_status(Severity status) const {
        return static_cast<std::size_t>(
            ranges::count_if(results, [status](const RepoResult& res) { return res.status == status; }));
    }

    std::size_t num_unsuccessful() const { return results.size() - num_with_status(Severity::Success); }
};

} // namespace junitgrader

template <>
struct fmt::formatter<::junitgrader::GradingError> : fmt::formatter<std::string>
{
    auto format(const ::junitgrader::GradingError& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(fmt::format("{}: {}", format_as(from.severity), from.message), ctx);
    }
};
