#pragma once

#include "user/program_options.hpp"

#include <junitgrader/common/class_traits.hpp>
#include <junitgrader/common/expected.hpp>

#include <argparse/argparse.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

/// Wrapper around argparse that assembles ProgramOptions from the command line and the config file
class CommandLineArgs : NonMovable
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    /// Returns:
    ///   Success - Expected<ProgramOptions> with parsed and validated program options
    ///   Failure - Expected<std::string> with failure message
    Expected<ProgramOptions, std::string> parse();

    std::string usage_message() const;
    std::string help_message() const;

private:
    /// Set up the ArgumentParsers for fields of ProgramOptions
    void setup_parser();
    void setup_generate_rtd_parser();

    /// Defaults, overridden by the config file, overridden by the command line
    Expected<ProgramOptions, std::string> assemble_options() const;

    Expected<void, std::string> apply_config_file(GraderOptions& options) const;
    void apply_grade_args(ProgramOptions& options) const;
    void apply_generate_rtd_args(ProgramOptions& options) const;

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    static constexpr std::string_view GENERATE_RTD_COMMAND = "generate-rtd";

    argparse::ArgumentParser arg_parser_;
    argparse::ArgumentParser generate_rtd_parser_;
    std::vector<std::string> args_;

    /// Whether the first argument selects the `generate-rtd` subcommand
    bool generate_rtd_used_;
};

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code = 1) noexcept;

} // namespace junitgrader
