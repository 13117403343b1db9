#include <junitgrader/java/matcher.hpp>

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/grading_session.hpp>
#include <junitgrader/java/file_searcher.hpp>
#include <junitgrader/java/java_source.hpp>
#include <junitgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/action/sort.hpp>
#include <range/v3/action/unique.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/set_algorithm.hpp>
#include <range/v3/algorithm/sort.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>
#include <range/v3/view/zip.hpp>

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader::java {

namespace {

std::vector<JavaSource> to_sources(const std::vector<std::filesystem::path>& paths) {
    return paths | ranges::views::transform([](const std::filesystem::path& path) { return JavaSource{path}; }) |
           ranges::to<std::vector>();
}

std::vector<std::string> filenames_of(const std::vector<JavaSource>& sources) {
    return sources | ranges::views::transform(&JavaSource::get_filename) | ranges::to<std::vector>();
}

/// Sort key used to line up reference test classes with student test classes
std::string fqn_sort_key(const JavaSource& source) {
    return fully_qualified_name(source.get_package(), source.get_filename());
}

std::vector<JavaSource> sorted_by_fqn(std::vector<JavaSource> sources) {
    ranges::sort(sources, [](const JavaSource& lhs, const JavaSource& rhs) {
        return fqn_sort_key(lhs) < fqn_sort_key(rhs);
    });
    return sources;
}

GradingResult<void> check_exact_matches(const std::vector<JavaSource>& reference_test_classes,
                                        const std::vector<JavaSource>& student_test_classes) {
    std::vector<std::string> student_filenames = filenames_of(student_test_classes) | ranges::actions::sort;

    std::vector<std::string> duplicates;
    for (std::size_t i = 1; i < student_filenames.size(); ++i) {
        const std::string& name = student_filenames[i];

        if (name == student_filenames[i - 1] && (duplicates.empty() || duplicates.back() != name)) {
            duplicates.push_back(name);
        }
    }

    if (!duplicates.empty()) {
        return make_grading_error(fmt::format("Duplicates of the following test classes found in student repo: {}",
                                              fmt::join(duplicates, ", ")));
    }

    if (student_test_classes.size() < reference_test_classes.size()) {
        std::vector<std::string> reference_filenames =
            filenames_of(reference_test_classes) | ranges::actions::sort | ranges::actions::unique;

        std::vector<std::string> missing;
        ranges::set_difference(reference_filenames, student_filenames, std::back_inserter(missing));

        return make_grading_error(fmt::format("Missing the following test classes in student repo: {}",
                                              fmt::join(missing, ", ")));
    }

    std::vector<std::string> package_mismatches;
    for (const auto& [reference, student] :
         ranges::views::zip(sorted_by_fqn(reference_test_classes), sorted_by_fqn(student_test_classes))) {
        std::string expected_package = reference.get_package();
        std::string actual_package = student.get_package();

        if (expected_package != actual_package) {
            package_mismatches.push_back(fmt::format("Student's {} expected to have package {}, but had {}",
                                                     reference.get_filename(), expected_package, actual_package));
        }
    }

    if (!package_mismatches.empty()) {
        return make_grading_error(
            fmt::format("Package statement mismatch: {}", fmt::join(package_mismatches, ", ")));
    }

    return {};
}

} // namespace

GradingResult<std::string> resolve_assignment_name(std::string_view repo_name,
                                                   const std::vector<std::string>& assignment_names) {
    std::vector<std::string> matches =
        assignment_names | ranges::views::filter([repo_name](const std::string& name) {
            return repo_name.ends_with(name);
        }) |
        ranges::to<std::vector>();

    if (matches.empty()) {
        return make_grading_error(fmt::format("no assignment name matching the student repo {}", repo_name));
    }

    if (matches.size() > 1) {
        return make_grading_error(fmt::format("multiple matching assignment names: {}", fmt::join(matches, ", ")));
    }

    LOG_DEBUG("Resolved repo {} to assignment {}", repo_name, matches.front());

    return matches.front();
}

GradingResult<std::vector<JavaSource>> find_reference_test_classes(const std::filesystem::path& reference_tests_dir,
                                                                   std::string_view assignment_name,
                                                                   const std::vector<std::string>& ignore_tests) {
    const std::filesystem::path test_dir = reference_tests_dir / assignment_name;

    if (!std::filesystem::is_directory(test_dir)) {
        return make_grading_error(fmt::format("no reference test directory for {} in {}", assignment_name,
                                              reference_tests_dir.string()));
    }

    FileSearcher searcher{[&ignore_tests](std::string_view filename) {
        return filename.ends_with(TEST_CLASS_SUFFIX) && ranges::find(ignore_tests, filename) == ignore_tests.end();
    }};

    std::vector<JavaSource> test_classes = to_sources(searcher.search_recursive(test_dir));

    if (test_classes.empty()) {
        return make_grading_warning(
            fmt::format("no files ending in `{}` found in {}", TEST_CLASS_SUFFIX, test_dir.string()));
    }

    LOG_DEBUG("Found reference test classes: {}", test_classes);

    return test_classes;
}

GradingResult<std::vector<JavaSource>> find_student_matches(const std::filesystem::path& repo_root,
                                                            const std::vector<JavaSource>& reference_test_classes) {
    const std::set<std::string> reference_filenames = filenames_of(reference_test_classes) | ranges::to<std::set>();

    FileSearcher searcher{[&reference_filenames](std::string_view filename) {
        return reference_filenames.contains(std::string{filename});
    }};

    std::vector<JavaSource> matches = to_sources(searcher.search_recursive(repo_root));

    LOG_DEBUG("Found student test classes: {}", matches);

    TRY(check_exact_matches(reference_test_classes, matches));

    return matches;
}

std::vector<JavaSource> find_java_files(const std::filesystem::path& root) {
    FileSearcher searcher{[](std::string_view filename) { return is_source_file(filename); }};

    return to_sources(searcher.search_recursive(root));
}

} // namespace junitgrader::java
