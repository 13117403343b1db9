#pragma once

#include <junitgrader/grading_session.hpp>

#include <compare>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace junitgrader::java {

inline constexpr std::string_view SOURCE_EXTENSION = ".java";
inline constexpr std::string_view TEST_CLASS_SUFFIX = "Test.java";

/// Separator between classpath entries
inline constexpr char CLASSPATH_SEPARATOR = ':';

/// Returns the package declared on the first line of `file`, or an empty string for the default package.
/// Only the first line is considered; a package statement anywhere else is not recognized.
std::string extract_package(const std::filesystem::path& file);

/// Whether any line of `file` declares `[public] abstract class <SimpleName>`, where SimpleName is
/// the file's stem.
bool is_abstract_class(const std::filesystem::path& file);

/// `simple_name` if `package` is empty, otherwise `package.simple_name`
std::string fully_qualified_name(std::string_view package, std::string_view simple_name);

/// The fully qualified name of the class declared by a source file, based on its package statement
std::string fqn_from_file(const std::filesystem::path& file);

/// Whether `file` has the source extension
bool is_source_file(const std::filesystem::path& file);

/// Whether `file` is named like a test class (`*Test.java`)
bool is_test_class_file(const std::filesystem::path& file);

/// Returns the directory which the package hierarchy of `file` starts at.
///
/// The parent directory of `file` must end in the package name with each `.` replaced by a path separator.
/// Otherwise, returns an error describing the mismatch.
GradingResult<std::filesystem::path> package_root(const std::filesystem::path& file, std::string_view package);

/// Builds a classpath from `paths`, each one prepended to `base`, followed by the current working directory.
///
/// Example: build_classpath({"a", "b"}, "lib.jar") => "b:a:lib.jar:."
std::string build_classpath(const std::vector<std::string>& paths, std::string_view base = "");

/// A Java source file on disk. Derived attributes are read from the file on every query, never cached.
class JavaSource
{
public:
    explicit JavaSource(std::filesystem::path path);

    const std::filesystem::path& get_path() const { return path_; }

    std::string get_filename() const { return path_.filename().string(); }

    std::string get_simple_name() const { return path_.stem().string(); }

    std::string get_package() const { return extract_package(path_); }

    std::string get_fqn() const { return fully_qualified_name(get_package(), get_simple_name()); }

    bool is_abstract() const { return is_abstract_class(path_); }

    bool is_test_class() const { return is_test_class_file(path_); }

    GradingResult<std::filesystem::path> get_package_root() const { return package_root(path_, get_package()); }

    auto operator<=>(const JavaSource& rhs) const = default;

private:
    std::filesystem::path path_;
};

} // namespace junitgrader::java

template <>
struct fmt::formatter<::junitgrader::java::JavaSource> : fmt::formatter<std::string>
{
    auto format(const ::junitgrader::java::JavaSource& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(from.get_path().string(), ctx);
    }
};
