#pragma once

#include <junitgrader/grader_options.hpp>
#include <junitgrader/grading_session.hpp>
#include <junitgrader/java/compiler.hpp>
#include <junitgrader/java/java_source.hpp>
#include <junitgrader/runner/junit_runner.hpp>

#include <string>
#include <vector>

namespace junitgrader {

/// Grades a single student repo: matches the reference tests of its assignment, compiles each of them together with
/// the student's production class, runs them in a sandbox and reports the outcome.
class RepoPipeline
{
public:
    explicit RepoPipeline(const GraderOptions& options);

    /// Never throws. Any problem is reported as part of the result.
    RepoResult grade(const RepoInfo& repo) const;

private:
    GradingResult<RepoResult> grade_impl(const RepoInfo& repo) const;

    /// The test classes to compile and run: either the reference tests or the student's copies of them
    GradingResult<std::vector<java::JavaSource>> find_test_classes(const RepoInfo& repo) const;

    GradingResult<std::vector<runner::TestOutcome>> run_tests(const std::vector<java::CompiledPair>& compiled,
                                                              const std::string& classpath) const;

    const GraderOptions* options_;
};

} // namespace junitgrader
