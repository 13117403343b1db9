#pragma once

#include <junitgrader/common/class_traits.hpp>
#include <junitgrader/grading_session.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace junitgrader::runner {

/// Finds the path of the JUnit 4 jar (`junit-4.X[.Y].jar`) on a classpath
std::optional<std::string> find_junit_jar(std::string_view classpath);

/// A JVM security policy that grants nothing, except for reflective member access to the JUnit jar's codebase
std::string generate_security_policy(std::string_view junit_jar_path);

/// A security policy written to a temporary file. The file is deleted when this object is destroyed.
class SecurityPolicyFile : NonCopyable
{
public:
    /// Writes the default policy for the JUnit jar on `classpath` to a new temporary file.
    /// It is an error if there is no JUnit jar on the classpath.
    static GradingResult<SecurityPolicyFile> create(std::string_view classpath);

    ~SecurityPolicyFile();
    SecurityPolicyFile(SecurityPolicyFile&& other) noexcept;
    SecurityPolicyFile& operator=(SecurityPolicyFile&& rhs) noexcept;

    const std::filesystem::path& get_path() const { return path_; }

private:
    explicit SecurityPolicyFile(std::filesystem::path path);

    void remove() noexcept;

    std::filesystem::path path_;
};

/// The security policy to run student code with. Empty if `active` is false, in which case a warning is logged,
/// as the student code then runs without any restrictions.
GradingResult<std::optional<SecurityPolicyFile>> make_security_policy(std::string_view classpath, bool active);

} // namespace junitgrader::runner
