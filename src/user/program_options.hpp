#pragma once

#include <junitgrader/common/expected.hpp>
#include <junitgrader/grader_options.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace junitgrader {

struct ProgramOptions
{
    enum class Command { Grade, GenerateRtd } command = Command::Grade;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    /// Student repos to grade
    std::vector<std::filesystem::path> repos;

    GraderOptions grader;

    // generate-rtd only
    std::filesystem::path template_dir;

    /// Resolve `colorize_option` for output to stdout
    static bool should_colorize(ColorizeOpt colorize_option);

    /// Verify that all fields are valid for the selected command
    Expected<void, std::string> validate() const;
};

} // namespace junitgrader
