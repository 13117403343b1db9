#pragma once

#include <junitgrader/grading_session.hpp>
#include <junitgrader/java/java_source.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader::java {

/// Finds the single assignment name that `repo_name` ends with.
/// Zero or several matches are errors; ambiguous naming is never resolved silently.
GradingResult<std::string> resolve_assignment_name(std::string_view repo_name,
                                                   const std::vector<std::string>& assignment_names);

/// Collects every `*Test.java` file below `<reference_tests_dir>/<assignment_name>` whose filename is not in
/// `ignore_tests`, sorted by path.
///
/// A missing directory is an error. Finding no test classes is a warning, as there is nothing to grade.
GradingResult<std::vector<JavaSource>> find_reference_test_classes(const std::filesystem::path& reference_tests_dir,
                                                                   std::string_view assignment_name,
                                                                   const std::vector<std::string>& ignore_tests);

/// Finds the files in a student repo that share a filename with one of the `reference_test_classes`.
///
/// Every reference test class must be matched exactly once, and each match must declare the same package as its
/// reference counterpart. Any violation is an error that lists all offending classes.
GradingResult<std::vector<JavaSource>> find_student_matches(const std::filesystem::path& repo_root,
                                                            const std::vector<JavaSource>& reference_test_classes);

/// All `.java` files in the subtree of `root`, sorted by path
std::vector<JavaSource> find_java_files(const std::filesystem::path& root);

} // namespace junitgrader::java
