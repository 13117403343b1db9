#include <junitgrader/java/compiler.hpp>

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/java/file_searcher.hpp>
#include <junitgrader/java/java_source.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/subprocess/subprocess.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/for_each.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace junitgrader::java {

PairwiseCompiler::PairwiseCompiler(std::string classpath, std::string compiler,
                                   std::optional<std::chrono::seconds> timeout)
    : classpath_{std::move(classpath)}
    , compiler_{std::move(compiler)}
    , timeout_{timeout} {}

CompileResults PairwiseCompiler::compile_all(const std::vector<JavaSource>& test_classes,
                                             const std::vector<JavaSource>& prod_candidates) const {
    CompileResults results;

    for (const JavaSource& test_class : test_classes) {
        // Abstract test classes are not runnable on their own
        if (test_class.is_abstract()) {
            LOG_DEBUG("Skipping abstract test class {}", test_class);
            continue;
        }

        CompileOutcome outcome = compile(test_class, prod_candidates);

        if (auto* pair = std::get_if<CompiledPair>(&outcome)) {
            results.succeeded.push_back(std::move(*pair));
        } else {
            results.failed.push_back(std::get<CompileFailure>(std::move(outcome)));
        }
    }

    return results;
}

CompileOutcome PairwiseCompiler::compile(const JavaSource& test_class,
                                         const std::vector<JavaSource>& prod_candidates) const {
    std::vector<JavaSource> prod_classes = find_prod_classes(test_class, prod_candidates);

    if (prod_classes.size() != 1) {
        std::string fqn = test_class.get_fqn();
        std::string_view reason =
            prod_classes.empty() ? "no production class found for" : "multiple production classes found for";

        LOG_DEBUG("{} {}: {}", reason, fqn, prod_classes);

        return CompileFailure{.test_class_fqn = fqn, .message = fmt::format("{} {}", reason, fqn)};
    }

    return run_compiler(test_class, prod_classes.front());
}

std::vector<JavaSource> PairwiseCompiler::find_prod_classes(const JavaSource& test_class,
                                                            const std::vector<JavaSource>& prod_candidates) {
    std::string filename = test_class.get_filename();
    std::string prod_filename = filename.substr(0, filename.size() - TEST_CLASS_SUFFIX.size()) +
                                std::string{SOURCE_EXTENSION};
    std::string package = test_class.get_package();

    return prod_candidates | ranges::views::filter([&](const JavaSource& candidate) {
               return candidate.get_filename() == prod_filename && candidate.get_package() == package;
           }) |
           ranges::to<std::vector>();
}

std::vector<std::filesystem::path> PairwiseCompiler::files_to_compile(const JavaSource& test_class,
                                                                      const JavaSource& prod_class) {
    FileSearcher prod_searcher{
        [](std::string_view filename) { return is_source_file(filename) && !is_test_class_file(filename); }};
    FileSearcher test_searcher{[](std::string_view filename) { return is_test_class_file(filename); }};

    std::vector<std::filesystem::path> files = prod_searcher.search(prod_class.get_path().parent_path());
    std::vector<std::filesystem::path> test_files = test_searcher.search(test_class.get_path().parent_path());

    files.insert(files.end(), test_files.begin(), test_files.end());

    return files;
}

CompileOutcome PairwiseCompiler::run_compiler(const JavaSource& test_class, const JavaSource& prod_class) const {
    std::string fqn = test_class.get_fqn();

    std::vector<std::string> args{"-cp", build_classpath({}, classpath_)};
    ranges::for_each(files_to_compile(test_class, prod_class),
                     [&args](const std::filesystem::path& path) { args.push_back(path.string()); });

    Subprocess compiler_proc{compiler_, args};

    if (!compiler_proc.start()) {
        throw std::runtime_error(fmt::format("failed to start compiler {}", compiler_));
    }

    auto run_res = compiler_proc.wait_for_exit(timeout_);

    if (!run_res) {
        if (run_res.error() == ErrorKind::TimedOut) {
            return CompileFailure{.test_class_fqn = fqn,
                                  .message = fmt::format("Compilation of {} timed out after {} seconds", fqn,
                                                         timeout_.value_or(std::chrono::seconds{}).count())};
        }

        throw std::runtime_error(fmt::format("failed to run compiler {}: {}", compiler_, format_as(run_res.error())));
    }

    if (!run_res->is_success()) {
        LOG_DEBUG("Compilation of {} failed: {}", fqn, *run_res);
        return CompileFailure{.test_class_fqn = fqn, .message = compiler_proc.get_stderr()};
    }

    LOG_DEBUG("Compiled {} with {}", fqn, prod_class);

    return CompiledPair{.test_class = test_class, .prod_class = prod_class};
}

} // namespace junitgrader::java
