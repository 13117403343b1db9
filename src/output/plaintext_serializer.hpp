#pragma once

#include "output/serializer.hpp"
#include "output/sink.hpp"

#include <junitgrader/grading_session.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace junitgrader {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, bool do_colorize);

    void on_repo_result(const RepoResult& data) override;
    void on_multi_repo_result(const MultiRepoResult& data) override;
    void on_command_result(std::string_view command, Severity status, std::string_view msg) override;

    void finalize() override;

private:
    std::string style_str(std::string_view str, fmt::text_style style) const;

    /// `[SEVERITY]`, colored by severity
    std::string severity_tag(Severity status) const;

    /// Conditionally make a word singular or plural based on `count`
    /// Singular if and only if `count == 1`
    ///
    /// Examples:
    ///  pluralize("repo", 0) => "repos"
    ///  pluralize("repo", 1) => "repo"
    static std::string pluralize(std::string_view root, std::size_t count, std::string_view suffix = "s");

    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto HEADER_STYLE = fmt::emphasis::bold;

    bool do_colorize_;
};

} // namespace junitgrader
