#pragma once

#include "output/serializer.hpp"

#include <junitgrader/grader_options.hpp>
#include <junitgrader/grading_session.hpp>

#include <filesystem>
#include <memory>
#include <vector>

namespace junitgrader {

/// Grades repos one after another. The failure of one repo never stops the grading of the next.
class MultiRepoRunner
{
public:
    MultiRepoRunner(const GraderOptions& options, const std::shared_ptr<Serializer>& serializer);

    MultiRepoResult run_all_repos(const std::vector<std::filesystem::path>& repo_paths) const;

private:
    const GraderOptions* options_;
    std::shared_ptr<Serializer> serializer_;
};

} // namespace junitgrader
