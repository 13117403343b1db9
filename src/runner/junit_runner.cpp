#include <junitgrader/runner/junit_runner.hpp>

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/common/overloaded.hpp>
#include <junitgrader/grading_session.hpp>
#include <junitgrader/java/compiler.hpp>
#include <junitgrader/java/java_source.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/runner/junit_output.hpp>
#include <junitgrader/subprocess/run_result.hpp>
#include <junitgrader/subprocess/subprocess.hpp>

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace junitgrader::runner {

TestOutcome TestOutcome::completed(std::string fqn, const RunResult& run_result, std::string_view output) {
    return TestOutcome{.fqn = std::move(fqn),
                       .outcome = Completed{.success = run_result.is_success(), .counts = parse_junit_output(output)}};
}

TestOutcome TestOutcome::timed_out(std::string fqn, std::chrono::milliseconds timeout) {
    return TestOutcome{.fqn = std::move(fqn), .outcome = TimedOut{.timeout = timeout}};
}

bool TestOutcome::is_success() const {
    const auto* completed = std::get_if<Completed>(&outcome);
    return completed != nullptr && completed->success;
}

int TestOutcome::num_passed() const {
    return std::visit(Overloaded{[](const Completed& completed) { return completed.counts.num_passed; },
                                 [](const TimedOut& /*unused*/) { return 0; }},
                      outcome);
}

int TestOutcome::num_failed() const {
    return std::visit(Overloaded{[](const Completed& completed) { return completed.counts.num_failed; },
                                 [](const TimedOut& /*unused*/) { return 0; }},
                      outcome);
}

const std::vector<std::string>& TestOutcome::failures() const {
    static const std::vector<std::string> NO_FAILURES;

    const auto* completed = std::get_if<Completed>(&outcome);
    return completed != nullptr ? completed->counts.failures : NO_FAILURES;
}

JunitRunner::JunitRunner(std::string classpath, std::chrono::milliseconds timeout, std::string java)
    : classpath_{std::move(classpath)}
    , timeout_{timeout}
    , java_{std::move(java)} {}

GradingResult<TestOutcome> JunitRunner::run(const java::CompiledPair& pair,
                                            const std::optional<std::filesystem::path>& security_policy) const {
    const java::JavaSource& test_class = pair.test_class;
    const java::JavaSource& prod_class = pair.prod_class;

    const std::string package = test_class.get_package();
    const std::string prod_package = prod_class.get_package();

    // The compiler only pairs classes of the same package; this guards against misuse
    if (package != prod_package) {
        return make_grading_error(fmt::format("Test class {} in package {}, but class {} in package {}",
                                              test_class.get_filename(), package, prod_class.get_filename(),
                                              prod_package));
    }

    std::filesystem::path prod_root = TRY(java::package_root(prod_class.get_path(), package));
    std::filesystem::path test_root = TRY(java::package_root(test_class.get_path(), package));

    const std::string classpath = java::build_classpath({test_root.string(), prod_root.string()}, classpath_);
    const std::string fqn = java::fully_qualified_name(package, test_class.get_simple_name());

    Subprocess java_proc{java_, build_args(fqn, classpath, security_policy)};

    if (!java_proc.start()) {
        throw std::runtime_error(fmt::format("failed to start {}", java_));
    }

    auto run_res = java_proc.wait_for_exit(timeout_);

    if (!run_res) {
        if (run_res.error() == ErrorKind::TimedOut) {
            LOG_INFO("{} timed out after {}ms", fqn, timeout_.count());
            return TestOutcome::timed_out(fqn, timeout_);
        }

        throw std::runtime_error(fmt::format("failed to run {}: {}", java_, format_as(run_res.error())));
    }

    LOG_DEBUG("{} finished: {}\nstdout:\n{}\nstderr:\n{}", fqn, *run_res, java_proc.get_stdout(),
              java_proc.get_stderr());

    // The child could not exec java, so there is no test run to grade
    if (*run_res == RunResult::make_exited(Subprocess::EXEC_FAILURE_EXIT_CODE) && java_proc.get_stdout().empty()) {
        std::string_view reason = java_proc.get_stderr();
        while (reason.ends_with('\n')) {
            reason.remove_suffix(1);
        }

        throw std::runtime_error(fmt::format("could not run {}: {}", fqn, reason));
    }

    return TestOutcome::completed(fqn, *run_res, java_proc.get_stdout());
}

std::vector<std::string> JunitRunner::build_args(std::string_view test_class_fqn, std::string_view classpath,
                                                 const std::optional<std::filesystem::path>& security_policy) {
    std::vector<std::string> args{"-enableassertions"};

    if (security_policy) {
        args.emplace_back("-Djava.security.manager");
        // `==` replaces the JVM's default policy instead of adding to it
        args.push_back(fmt::format("-Djava.security.policy=={}", security_policy->string()));
    }

    args.emplace_back("-cp");
    args.emplace_back(classpath);
    args.emplace_back(JUNIT_RUNNER_MAIN);
    args.emplace_back(test_class_fqn);

    return args;
}

} // namespace junitgrader::runner
