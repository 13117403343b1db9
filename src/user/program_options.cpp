#include "user/program_options.hpp"

#include "common/terminal.hpp"

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/common/expected.hpp>
#include <junitgrader/logging.hpp>

#include <fmt/format.h>

#include <cstdio>
#include <filesystem>
#include <string>

namespace junitgrader {

bool ProgramOptions::should_colorize(ColorizeOpt colorize_option) {
    using enum ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

Expected<void, std::string> ProgramOptions::validate() const {
    if (command == Command::GenerateRtd) {
        if (grader.assignment_names.empty()) {
            return "no assignment names given";
        }

        if (!std::filesystem::is_directory(template_dir)) {
            return fmt::format("{} is not a directory", template_dir.string());
        }

        return {};
    }

    if (repos.empty()) {
        return "no student repos given";
    }

    TRY(grader.validate());

    return {};
}

} // namespace junitgrader
