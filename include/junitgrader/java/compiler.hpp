#pragma once

#include <junitgrader/java/java_source.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace junitgrader::java {

/// A test class that compiled together with its production class. Both declare the same package.
struct CompiledPair
{
    JavaSource test_class;
    JavaSource prod_class;

    bool operator==(const CompiledPair& rhs) const = default;
};

/// A test class that could not be compiled
struct CompileFailure
{
    std::string test_class_fqn;
    std::string message;

    bool operator==(const CompileFailure& rhs) const = default;
};

using CompileOutcome = std::variant<CompiledPair, CompileFailure>;

struct CompileResults
{
    std::vector<CompiledPair> succeeded;
    std::vector<CompileFailure> failed;
};

/// Compiles each test class together with only the production code it exercises
class PairwiseCompiler
{
public:
    static constexpr std::string_view DEFAULT_COMPILER = "javac";

    explicit PairwiseCompiler(std::string classpath, std::string compiler = std::string{DEFAULT_COMPILER},
                              std::optional<std::chrono::seconds> timeout = std::nullopt);

    /// Compiles every concrete test class in `test_classes` against its production class from `prod_candidates`.
    /// Abstract test classes are skipped. Results keep the order of `test_classes`.
    CompileResults compile_all(const std::vector<JavaSource>& test_classes,
                               const std::vector<JavaSource>& prod_candidates) const;

    CompileOutcome compile(const JavaSource& test_class, const std::vector<JavaSource>& prod_candidates) const;

    /// All production candidates with the test class' name minus the `Test` suffix, in the same package
    static std::vector<JavaSource> find_prod_classes(const JavaSource& test_class,
                                                     const std::vector<JavaSource>& prod_candidates);

    /// The files compiled together for a test/production pair:
    /// every non-test source file beside the production class, and every test class beside the test class.
    static std::vector<std::filesystem::path> files_to_compile(const JavaSource& test_class,
                                                               const JavaSource& prod_class);

private:
    CompileOutcome run_compiler(const JavaSource& test_class, const JavaSource& prod_class) const;

    std::string classpath_;
    std::string compiler_;
    std::optional<std::chrono::seconds> timeout_;
};

} // namespace junitgrader::java
