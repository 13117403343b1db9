#include "app/grade_app.hpp"

#include "multi_repo_runner.hpp"

#include <junitgrader/grading_session.hpp>
#include <junitgrader/logging.hpp>

#include <gsl/util>

#include <algorithm>
#include <cstddef>

namespace junitgrader {

int GradeApp::run_impl() {
    const ProgramOptions& options = get_options();

    LOG_DEBUG("Grading {} repos", options.repos.size());

    MultiRepoRunner runner{options.grader, get_serializer()};

    MultiRepoResult res = runner.run_all_repos(options.repos);

    get_serializer()->finalize();

    // One point of exit status per repo that did not fully succeed
    const std::size_t num_unsuccessful = std::min(res.num_unsuccessful(), static_cast<std::size_t>(MAX_EXIT_CODE));

    return gsl::narrow_cast<int>(num_unsuccessful);
}

} // namespace junitgrader
