#include <junitgrader/java/file_searcher.hpp>

#include <junitgrader/logging.hpp>

#include <range/v3/action/sort.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace junitgrader::java {

FileSearcher::FileSearcher(std::string expr)
    : predicate_{[regex = std::regex{expr}](std::string_view filename) {
        return std::regex_match(filename.begin(), filename.end(), regex);
    }} {
    LOG_DEBUG("Created file searcher with RegEx string: {}", expr);
}

FileSearcher::FileSearcher(std::function<bool(std::string_view)> predicate)
    : predicate_{std::move(predicate)} {}

std::vector<std::filesystem::path> FileSearcher::search(const std::filesystem::path& base) const {
    return search_impl<std::filesystem::directory_iterator>(base);
}

std::vector<std::filesystem::path> FileSearcher::search_recursive(const std::filesystem::path& base) const {
    return search_impl<std::filesystem::recursive_directory_iterator>(base);
}

template <typename DirectoryIterator>
std::vector<std::filesystem::path> FileSearcher::search_impl(const std::filesystem::path& base) const {
    namespace fs = std::filesystem;

    std::vector<fs::path> result;

    std::size_t search_counter = 0;
    for (const fs::directory_entry& entry : DirectoryIterator{base, fs::directory_options::skip_permission_denied}) {
        search_counter++;

        if (!entry.is_regular_file()) {
            continue;
        }

        if (does_match(entry.path().filename().string())) {
            result.push_back(entry.path());
        }
    }

    LOG_DEBUG("Searched through {} files in {}, {} matched", search_counter, base.string(), result.size());

    return std::move(result) | ranges::actions::sort;
}

bool FileSearcher::does_match(std::string_view filename) const {
    LOG_TRACE("Attempting to match filename: {:?}", filename);
    return predicate_(filename);
}

} // namespace junitgrader::java
