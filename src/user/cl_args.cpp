#include "user/cl_args.hpp"

#include "user/config_file_reader.hpp"
#include "user/program_options.hpp"

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/common/expected.hpp>
#include <junitgrader/grader_options.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/output/report.hpp>
#include <junitgrader/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ JUNITGRADER_VERSION_STRING, argparse::default_arguments::help}
    , generate_rtd_parser_{fmt::format("{} {}", get_basename(args[0]), GENERATE_RTD_COMMAND),
                           JUNITGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()}
    , generate_rtd_used_{args_.size() > 1 && args_[1] == GENERATE_RTD_COMMAND} {
    // Add parser arguments
    setup_parser();
    setup_generate_rtd_parser();
}

void CommandLineArgs::setup_parser() {
    arg_parser_.add_description(fmt::format("JUnitGrader v{}\nCompiles and runs JUnit 4 reference tests against "
                                            "student repos, one repo at a time.",
                                            JUNITGRADER_VERSION_STRING));

    // clang-format off
    arg_parser_.add_argument("repos")
        .nargs(argparse::nargs_pattern::any)
        .metavar("REPO")
        .help("Student repos to grade. The directory name selects the assignment.");

    arg_parser_.add_argument("-a", "--assignments")
        .nargs(argparse::nargs_pattern::at_least_one)
        .metavar("NAME")
        .help("Names of the assignments. Each student repo name must end with exactly one of them.");

    arg_parser_.add_argument("-r", "--reference-tests-dir")
        .metavar("DIR")
        .help("Directory with one subdirectory of reference tests per assignment");

    arg_parser_.add_argument("-i", "--ignore-tests")
        .nargs(argparse::nargs_pattern::at_least_one)
        .metavar("NAME")
        .help("Filenames of test classes to ignore");

    arg_parser_.add_argument("--hamcrest-path")
        .metavar("JAR")
        .help(fmt::format("Path to the `{}` library", GraderOptions::HAMCREST_JAR));

    arg_parser_.add_argument("--junit-path")
        .metavar("JAR")
        .help(fmt::format("Path to the `{}` library", GraderOptions::JUNIT_JAR));

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", JUNITGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    auto& verbosity_mutex = arg_parser_.add_mutually_exclusive_group();

    verbosity_mutex.add_argument("-v", "--verbose")
        .flag()
        .help("Display more information about test failures");

    verbosity_mutex.add_argument("-vv", "--very-verbose")
        .flag()
        .help("Display the full failure output, without truncating");

    arg_parser_.add_argument("--disable-security")
        .flag()
        .help("Disable the default security policy (student code can do whatever)");

    arg_parser_.add_argument("--run-student-tests")
        .flag()
        .help("Run the test classes found in the student repos instead of the reference tests. "
              "Only tests that exist in the reference tests directory are searched for.");

    arg_parser_.add_argument("-t", "--timeout")
        .scan<'i', int>()
        .metavar("SECONDS")
        .help(fmt::format("Maximum time a single test class may run (default: {})",
                          GraderOptions::DEFAULT_TIMEOUT.count()));

    arg_parser_.add_argument("--compile-timeout")
        .scan<'i', int>()
        .metavar("SECONDS")
        .help("Maximum time a single compilation may take (default: unbounded)");

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors");

    arg_parser_.add_argument("--config")
        .metavar("FILE")
        .help("INI config file with a [junit4] section (default: $XDG_CONFIG_HOME/junitgrader/config.ini)");
    // clang-format on

    arg_parser_.add_epilog(fmt::format("Run `{} {} --help` for generating a reference tests directory.",
                                       get_basename(args_[0]), GENERATE_RTD_COMMAND));
}

void CommandLineArgs::setup_generate_rtd_parser() {
    generate_rtd_parser_.add_description(
        "Generate the reference tests directory by copying the test classes of template repos. "
        "There must not be a directory for any of the assignments in the reference tests directory yet.");

    // clang-format off
    generate_rtd_parser_.add_argument("-a", "--assignments")
        .nargs(argparse::nargs_pattern::at_least_one)
        .metavar("NAME")
        .help("Names of the assignments, which are also the names of their template repos");

    generate_rtd_parser_.add_argument("-r", "--reference-tests-dir")
        .metavar("DIR")
        .help("Path to place the root reference tests directory at");

    generate_rtd_parser_.add_argument("--template-dir")
        .required()
        .metavar("DIR")
        .help("Directory containing one checked out template repo per assignment");

    generate_rtd_parser_.add_argument("--config")
        .metavar("FILE")
        .help("INI config file with a [junit4] section");
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        if (generate_rtd_used_) {
            // The subcommand is dispatched here, as the variadic `repos` positional would swallow it
            generate_rtd_parser_.parse_args(std::vector<std::string>{std::next(args_.begin()), args_.end()});
        } else {
            arg_parser_.parse_args(args_);
        }
    } catch (const std::exception& err) {
        return err.what();
    }

    ProgramOptions options = TRY(assemble_options());

    TRY(options.validate());

    return options;
}

Expected<ProgramOptions, std::string> CommandLineArgs::assemble_options() const {
    ProgramOptions options;

    if (const char* env_classpath = std::getenv("CLASSPATH"); env_classpath != nullptr) {
        options.grader.env_classpath = env_classpath;
    }

    TRY(apply_config_file(options.grader));

    if (generate_rtd_used_) {
        apply_generate_rtd_args(options);
    } else {
        apply_grade_args(options);
    }

    LOG_DEBUG("Reference tests dir: {}, assignments: {}", options.grader.reference_tests_dir.string(),
              options.grader.assignment_names);

    return options;
}

Expected<void, std::string> CommandLineArgs::apply_config_file(GraderOptions& options) const {
    const argparse::ArgumentParser& parser =
        generate_rtd_used_ ? generate_rtd_parser_ : arg_parser_;

    std::optional<std::filesystem::path> config_path = parser.present("--config");

    if (!config_path) {
        config_path = ConfigFileReader::default_path();

        // The default config file is optional
        if (!config_path || !std::filesystem::exists(*config_path)) {
            LOG_DEBUG("No config file found");
            return {};
        }
    }

    LOG_DEBUG("Reading config file {:?}", config_path->string());

    ConfigFile config = TRY(ConfigFileReader{*config_path}.read());

    TRY(apply_config(config, options));

    return {};
}

void CommandLineArgs::apply_grade_args(ProgramOptions& options) const {
    GraderOptions& grader = options.grader;

    options.command = ProgramOptions::Command::Grade;

    if (auto repos = arg_parser_.present<std::vector<std::string>>("repos")) {
        options.repos = *repos | ranges::views::transform([](const std::string& repo) {
            return std::filesystem::path{repo};
        }) | ranges::to<std::vector>();
    }

    if (auto assignments = arg_parser_.present<std::vector<std::string>>("--assignments")) {
        grader.assignment_names = *assignments;
    }
    if (auto reference_tests_dir = arg_parser_.present("--reference-tests-dir")) {
        grader.reference_tests_dir = *reference_tests_dir;
    }
    if (auto ignore_tests = arg_parser_.present<std::vector<std::string>>("--ignore-tests")) {
        grader.ignore_tests = *ignore_tests;
    }
    if (auto hamcrest_path = arg_parser_.present("--hamcrest-path")) {
        grader.hamcrest_path = *hamcrest_path;
    }
    if (auto junit_path = arg_parser_.present("--junit-path")) {
        grader.junit_path = *junit_path;
    }
    if (auto timeout = arg_parser_.present<int>("--timeout")) {
        grader.timeout = std::chrono::seconds{*timeout};
    }
    if (auto compile_timeout = arg_parser_.present<int>("--compile-timeout")) {
        grader.compile_timeout = std::chrono::seconds{*compile_timeout};
    }

    // A flag on the command line can only enable what the config file may have left disabled
    grader.disable_security = grader.disable_security || arg_parser_.get<bool>("--disable-security");
    grader.run_student_tests = arg_parser_.get<bool>("--run-student-tests");

    if (arg_parser_.get<bool>("--very-verbose")) {
        grader.verbosity = output::Verbosity::VeryVerbose;
    } else if (arg_parser_.get<bool>("--verbose")) {
        grader.verbosity = output::Verbosity::Verbose;
    }

    using enum ProgramOptions::ColorizeOpt;

    const auto color = arg_parser_.get<std::string>("--color");
    if (color == "never") {
        options.colorize_option = Never;
    } else if (color == "always") {
        options.colorize_option = Always;
    } else {
        options.colorize_option = Auto;
    }

    grader.colorize = ProgramOptions::should_colorize(options.colorize_option);
}

void CommandLineArgs::apply_generate_rtd_args(ProgramOptions& options) const {
    options.command = ProgramOptions::Command::GenerateRtd;

    if (auto assignments = generate_rtd_parser_.present<std::vector<std::string>>("--assignments")) {
        options.grader.assignment_names = *assignments;
    }
    if (auto reference_tests_dir = generate_rtd_parser_.present("--reference-tests-dir")) {
        options.grader.reference_tests_dir = *reference_tests_dir;
    }

    options.template_dir = generate_rtd_parser_.get("--template-dir");
    options.grader.colorize = ProgramOptions::should_colorize(options.colorize_option);
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return generate_rtd_used_ ? generate_rtd_parser_.usage() : arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace junitgrader
