#include "app/generate_rtd_app.hpp"

#include <junitgrader/grading_session.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/rtd/reference_tests_generator.hpp>

#include <cstdlib>

namespace junitgrader {

int GenerateRtdApp::run_impl() {
    const ProgramOptions& options = get_options();
    PlainTextSerializer& serializer = *get_serializer();

    auto res = rtd::generate_reference_tests_dir(options.grader.reference_tests_dir, options.grader.assignment_names,
                                                 options.template_dir);

    if (!res) {
        LOG_DEBUG("Failed to generate reference tests directory: {}", res.error());
        serializer.on_command_result(COMMAND_NAME, res.error().severity, res.error().message);
    } else {
        serializer.on_command_result(COMMAND_NAME, Severity::Success, res.value());
    }

    serializer.finalize();

    return res ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace junitgrader
