#include <junitgrader/pipeline.hpp>

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/grader_options.hpp>
#include <junitgrader/grading_session.hpp>
#include <junitgrader/java/compiler.hpp>
#include <junitgrader/java/java_source.hpp>
#include <junitgrader/java/matcher.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/output/report.hpp>
#include <junitgrader/runner/junit_runner.hpp>
#include <junitgrader/runner/security_policy.hpp>

#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace junitgrader {

RepoPipeline::RepoPipeline(const GraderOptions& options)
    : options_{&options} {}

RepoResult RepoPipeline::grade(const RepoInfo& repo) const {
    LOG_DEBUG("Grading repo {:?} at {}", repo.name, repo.path.string());

    try {
        GradingResult<RepoResult> result = grade_impl(repo);

        if (!result) {
            LOG_DEBUG("Grading of {:?} stopped early: {}", repo.name, result.error());
            return RepoResult{.info = repo, .status = result.error().severity, .msg = result.error().message};
        }

        return result.value();
    } catch (const std::exception& ex) {
        LOG_DEBUG("Unexpected exception while grading {:?}: {}", repo.name, ex.what());
        return RepoResult{.info = repo, .status = Severity::Error, .msg = ex.what()};
    }
}

GradingResult<RepoResult> RepoPipeline::grade_impl(const RepoInfo& repo) const {
    if (!std::filesystem::exists(repo.path)) {
        return make_grading_error(fmt::format("student repo {} does not exist", repo.path.string()));
    }

    std::vector<java::JavaSource> test_classes = TRY(find_test_classes(repo));

    const std::string classpath = options_->base_classpath();

    java::PairwiseCompiler compiler{classpath, options_->javac_executable, options_->compile_timeout};
    java::CompileResults compiled = compiler.compile_all(test_classes, java::find_java_files(repo.path));

    LOG_DEBUG("{} test classes compiled, {} failed", compiled.succeeded.size(), compiled.failed.size());

    std::vector<runner::TestOutcome> test_outcomes = TRY(run_tests(compiled.succeeded, classpath));

    return RepoResult{
        .info = repo,
        .status = output::overall_severity(test_outcomes, compiled.failed),
        .msg = output::format_results(test_outcomes, compiled.failed, options_->verbosity, options_->colorize)};
}

GradingResult<std::vector<java::JavaSource>> RepoPipeline::find_test_classes(const RepoInfo& repo) const {
    std::string assignment_name = TRY(java::resolve_assignment_name(repo.name, options_->assignment_names));

    std::vector<java::JavaSource> reference_test_classes =
        TRY(java::find_reference_test_classes(options_->reference_tests_dir, assignment_name, options_->ignore_tests));

    if (!options_->run_student_tests) {
        return reference_test_classes;
    }

    return java::find_student_matches(repo.path, reference_test_classes);
}

GradingResult<std::vector<runner::TestOutcome>>
RepoPipeline::run_tests(const std::vector<java::CompiledPair>& compiled, const std::string& classpath) const {
    // One policy file for all test classes of this repo, removed when this function returns
    auto security_policy = runner::make_security_policy(classpath, !options_->disable_security);
    if (!security_policy) {
        return security_policy.error();
    }

    std::optional<std::filesystem::path> policy_path;
    if (security_policy->has_value()) {
        policy_path = security_policy->value().get_path();
    }

    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(options_->timeout);
    runner::JunitRunner junit_runner{classpath, timeout, options_->java_executable};

    std::vector<runner::TestOutcome> outcomes;
    outcomes.reserve(compiled.size());

    for (const java::CompiledPair& pair : compiled) {
        outcomes.push_back(TRY(junit_runner.run(pair, policy_path)));
    }

    return outcomes;
}

} // namespace junitgrader
