#include "user/config_file_reader.hpp"

#include <junitgrader/common/expected.hpp>
#include <junitgrader/grader_options.hpp>
#include <junitgrader/logging.hpp>

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace junitgrader {

namespace {

std::string_view trim(std::string_view str) {
    constexpr std::string_view whitespace = " \t\r\n";

    std::size_t first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }

    std::size_t last = str.find_last_not_of(whitespace);

    return str.substr(first, last - first + 1);
}

std::string config_error(std::string_view key, std::string_view requirement, std::string_view value) {
    return fmt::format("config value {} in section [{}] must be {}, but was: {}", key, JUNIT4_SECTION, requirement,
                       value);
}

} // namespace

std::optional<std::string> ConfigFile::get(std::string_view section, std::string_view key) const {
    auto section_iter = sections_.find(section);
    if (section_iter == sections_.end()) {
        return std::nullopt;
    }

    auto value_iter = section_iter->second.find(key);
    if (value_iter == section_iter->second.end()) {
        return std::nullopt;
    }

    return value_iter->second;
}

void ConfigFile::set(const std::string& section, const std::string& key, std::string value) {
    sections_[section][key] = std::move(value);
}

ConfigFileReader::ConfigFileReader(std::filesystem::path path)
    : path_{std::move(path)} {}

Expected<ConfigFile, std::string> ConfigFileReader::read() const {
    std::ifstream in_file{path_};

    if (!in_file.is_open()) {
        return fmt::format("Failed to open config file {:?}", path_.string());
    }

    ConfigFile result;
    std::optional<std::string> section;

    std::string raw_line;
    for (int line_num = 1; std::getline(in_file, raw_line); ++line_num) {
        std::string_view line = trim(raw_line);

        if (line.empty() || line.starts_with('#') || line.starts_with(';')) {
            continue;
        }

        if (line.starts_with('[')) {
            if (!line.ends_with(']')) {
                return fmt::format("Malformed section header on line {} of config file: {:?}", line_num, line);
            }

            section = std::string{trim(line.substr(1, line.size() - 2))};
            continue;
        }

        std::size_t separator = line.find('=');

        if (separator == std::string_view::npos) {
            return fmt::format("Expected `key = value` on line {} of config file, but got: {:?}", line_num, line);
        }

        if (!section) {
            return fmt::format("Value on line {} of config file is not in any section", line_num);
        }

        std::string key{trim(line.substr(0, separator))};
        std::string value{trim(line.substr(separator + 1))};

        LOG_TRACE("Config [{}] {} = {:?}", *section, key, value);

        result.set(*section, key, std::move(value));
    }

    if (in_file.bad()) {
        return "IO error in reading config file";
    }

    return result;
}

std::optional<std::filesystem::path> ConfigFileReader::default_path() {
    const std::filesystem::path relative_path = std::filesystem::path{"junitgrader"} / "config.ini";

    if (const char* xdg_config_home = std::getenv("XDG_CONFIG_HOME");
        xdg_config_home != nullptr && *xdg_config_home != '\0') {
        return std::filesystem::path{xdg_config_home} / relative_path;
    }

    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path{home} / ".config" / relative_path;
    }

    return std::nullopt;
}

Expected<void, std::string> apply_config(const ConfigFile& config, GraderOptions& options) {
    if (!config.has_section(JUNIT4_SECTION)) {
        LOG_DEBUG("No [{}] section in config file", JUNIT4_SECTION);
        return {};
    }

    if (auto hamcrest_path = config.get(JUNIT4_SECTION, "hamcrest_path")) {
        options.hamcrest_path = *hamcrest_path;
    }

    if (auto junit_path = config.get(JUNIT4_SECTION, "junit_path")) {
        options.junit_path = *junit_path;
    }

    if (auto reference_tests_dir = config.get(JUNIT4_SECTION, "reference_tests_dir")) {
        options.reference_tests_dir = *reference_tests_dir;
    }

    if (auto timeout = config.get(JUNIT4_SECTION, "timeout")) {
        int seconds{};
        const char* end = timeout->data() + timeout->size();

        auto [ptr, ec] = std::from_chars(timeout->data(), end, seconds);

        if (ec != std::errc{} || ptr != end || timeout->empty()) {
            return config_error("timeout", "an integer", *timeout);
        }

        options.timeout = std::chrono::seconds{seconds};
    }

    if (auto ignore_tests = config.get(JUNIT4_SECTION, "ignore_tests")) {
        std::istringstream names{*ignore_tests};

        options.ignore_tests.clear();
        for (std::string name; names >> name;) {
            options.ignore_tests.push_back(std::move(name));
        }
    }

    if (auto disable_security = config.get(JUNIT4_SECTION, "disable_security")) {
        if (*disable_security == "true") {
            options.disable_security = true;
        } else if (*disable_security == "false") {
            options.disable_security = false;
        } else {
            return config_error("disable_security", "true or false", *disable_security);
        }
    }

    return {};
}

} // namespace junitgrader
