#include <junitgrader/rtd/reference_tests_generator.hpp>

#include <junitgrader/grading_session.hpp>
#include <junitgrader/java/file_searcher.hpp>
#include <junitgrader/java/java_source.hpp>
#include <junitgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader::rtd {

namespace {

/// Copies the test classes of a single template, returning the filenames of the copied files
std::vector<std::string> copy_test_classes(const std::filesystem::path& src_dir, const std::filesystem::path& dst_dir) {
    java::FileSearcher test_class_searcher{
        [](std::string_view filename) { return java::is_test_class_file(filename); }};

    std::vector<std::string> copied;

    for (const std::filesystem::path& test_class : test_class_searcher.search_recursive(src_dir)) {
        const std::filesystem::path dst = dst_dir / test_class.lexically_relative(src_dir);

        std::filesystem::create_directories(dst.parent_path());
        std::filesystem::copy_file(test_class, dst);

        LOG_DEBUG("Copied {} to {}", test_class.string(), dst.string());

        copied.push_back(test_class.filename().string());
    }

    return copied;
}

} // namespace

GradingResult<std::string> generate_reference_tests_dir(const std::filesystem::path& reference_tests_dir,
                                                        const std::vector<std::string>& assignment_names,
                                                        const std::filesystem::path& template_dir) {
    auto dir_exists = [&](const std::string& name) { return std::filesystem::exists(reference_tests_dir / name); };
    auto to_test_dir = [&](const std::string& name) { return (reference_tests_dir / name).string(); };

    std::vector existing_test_dirs = assignment_names                       //
                                     | ranges::views::filter(dir_exists)    //
                                     | ranges::views::transform(to_test_dir) //
                                     | ranges::to<std::vector>();

    if (!existing_test_dirs.empty()) {
        return make_grading_error(
            fmt::format("Some assignment test directories already exist, please delete and try again: {}",
                        fmt::join(existing_test_dirs, ", ")));
    }

    for (const std::string& name : assignment_names) {
        if (!std::filesystem::is_directory(template_dir / name)) {
            return make_grading_error(
                fmt::format("Failed to locate template for '{}'. Ensure that the repo exists.", name));
        }
    }

    std::vector<std::string> summary_lines;

    for (const std::string& name : assignment_names) {
        const std::filesystem::path assignment_test_dir = reference_tests_dir / name;
        std::filesystem::create_directories(assignment_test_dir);

        std::vector<std::string> test_classes = copy_test_classes(template_dir / name, assignment_test_dir);

        summary_lines.push_back(fmt::format("{}: {}", name, fmt::join(test_classes, ", ")));
    }

    return fmt::format("{}", fmt::join(summary_lines, "\n"));
}

} // namespace junitgrader::rtd
