#pragma once

#include <junitgrader/common/expected.hpp>
#include <junitgrader/grader_options.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace junitgrader {

/// Values of an INI-style config file, by section and key
class ConfigFile
{
public:
    std::optional<std::string> get(std::string_view section, std::string_view key) const;

    void set(const std::string& section, const std::string& key, std::string value);

    bool has_section(std::string_view section) const { return sections_.contains(section); }

private:
    std::map<std::string, std::map<std::string, std::string, std::less<>>, std::less<>> sections_;
};

/// Small reader for INI-style config files
/// Expects `[section]` headers followed by `key = value` lines. Lines starting with `#` or `;` are comments.
/// Keys before the first section header are not allowed.
class ConfigFileReader
{
public:
    explicit ConfigFileReader(std::filesystem::path path);

    Expected<ConfigFile, std::string> read() const;

    /// `$XDG_CONFIG_HOME/junitgrader/config.ini`, falling back to `~/.config/junitgrader/config.ini`.
    /// Empty if neither variable is set.
    static std::optional<std::filesystem::path> default_path();

private:
    std::filesystem::path path_;
};

inline constexpr std::string_view JUNIT4_SECTION = "junit4";

/// Overrides fields of `options` with the values in the `[junit4]` section of `config`
Expected<void, std::string> apply_config(const ConfigFile& config, GraderOptions& options);

} // namespace junitgrader
