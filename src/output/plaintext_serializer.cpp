#include "output/plaintext_serializer.hpp"

#include "output/serializer.hpp"
#include "output/sink.hpp"

#include <junitgrader/grading_session.hpp>

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace junitgrader {

PlainTextSerializer::PlainTextSerializer(Sink& sink, bool do_colorize)
    : Serializer{sink}
    , do_colorize_{do_colorize} {}

void PlainTextSerializer::on_repo_result(const RepoResult& data) {
    std::string out = fmt::format("{} {}\n", severity_tag(data.status), style_str(data.info.name, HEADER_STYLE));

    if (!data.msg.empty()) {
        out += fmt::format("{}\n", data.msg);
    }

    sink_.write(out);
}

void PlainTextSerializer::on_multi_repo_result(const MultiRepoResult& data) {
    const std::size_t num_repos = data.results.size();

    std::string out = fmt::format("\n{} {}: {} succeeded, {} with warnings, {} with errors\n", num_repos,
                                  pluralize("repo", num_repos), data.num_with_status(Severity::Success),
                                  data.num_with_status(Severity::Warning), data.num_with_status(Severity::Error));

    sink_.write(out);
}

void PlainTextSerializer::on_command_result(std::string_view command, Severity status, std::string_view msg) {
    sink_.write(fmt::format("{} {}\n{}\n", severity_tag(status), style_str(command, HEADER_STYLE), msg));
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

std::string PlainTextSerializer::style_str(std::string_view str, fmt::text_style style) const {
    if (!do_colorize_) {
        return std::string{str};
    }

    return fmt::format("{}", fmt::styled(str, style));
}

std::string PlainTextSerializer::severity_tag(Severity status) const {
    fmt::text_style style;

    switch (status) {
    case Severity::Success:
        style = SUCCESS_STYLE;
        break;
    case Severity::Warning:
        style = WARNING_STYLE;
        break;
    case Severity::Error:
        style = ERROR_STYLE;
        break;
    }

    return fmt::format("[{}]", style_str(format_as(status), style));
}

std::string PlainTextSerializer::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

} // namespace junitgrader
