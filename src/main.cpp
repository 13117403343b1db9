#include "app/generate_rtd_app.hpp"
#include "app/grade_app.hpp"
#include "app/trace_exception.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <junitgrader/logging.hpp>

#include <cstddef>
#include <exception>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    using namespace junitgrader;

    init_loggers();

    try {
        std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

        ProgramOptions options = parse_args_or_exit(args);

        if (options.command == ProgramOptions::Command::GenerateRtd) {
            return GenerateRtdApp{std::move(options)}.run();
        }

        return GradeApp{std::move(options)}.run();
    } catch (const std::exception& ex) {
        trace_exception(ex);
    }

    return App::EXIT_INTERNAL_ERROR;
}
