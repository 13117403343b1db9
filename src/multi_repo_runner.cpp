#include "multi_repo_runner.hpp"

#include "output/serializer.hpp"

#include <junitgrader/grader_options.hpp>
#include <junitgrader/grading_session.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/pipeline.hpp>

#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

namespace junitgrader {

MultiRepoRunner::MultiRepoRunner(const GraderOptions& options, const std::shared_ptr<Serializer>& serializer)
    : options_{&options}
    , serializer_{serializer} {}

MultiRepoResult MultiRepoRunner::run_all_repos(const std::vector<std::filesystem::path>& repo_paths) const {
    MultiRepoResult result;

    RepoPipeline pipeline{*options_};

    for (const std::filesystem::path& repo_path : repo_paths) {
        RepoResult res = DEBUG_TIME(pipeline.grade(RepoInfo::from_path(repo_path)));

        serializer_->on_repo_result(res);

        result.results.push_back(std::move(res));
    }

    serializer_->on_multi_repo_result(result);

    return result;
}

} // namespace junitgrader
