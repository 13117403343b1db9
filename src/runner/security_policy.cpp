#include <junitgrader/runner/security_policy.hpp>

#include <junitgrader/common/linux.hpp>
#include <junitgrader/grading_session.hpp>
#include <junitgrader/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>

namespace junitgrader::runner {

std::optional<std::string> find_junit_jar(std::string_view classpath) {
    static const std::regex JUNIT4_JAR_REGEX{R"([^:]*junit-4\.\d+\.(\d+\.)?jar)"};

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(classpath.begin(), classpath.end(), match, JUNIT4_JAR_REGEX)) {
        return std::nullopt;
    }

    return match[0].str();
}

std::string generate_security_policy(std::string_view junit_jar_path) {
    return fmt::format("grant {{\n}};\n"
                       "grant codeBase \"file:{}\" {{\n"
                       "    permission java.lang.RuntimePermission \"accessDeclaredMembers\";\n"
                       "}};\n",
                       junit_jar_path);
}

GradingResult<SecurityPolicyFile> SecurityPolicyFile::create(std::string_view classpath) {
    std::optional junit_jar = find_junit_jar(classpath);

    if (!junit_jar) {
        return make_grading_error("junit4 jar not on the classpath");
    }

    const std::string policy = generate_security_policy(*junit_jar);

    const std::string path_template = (std::filesystem::temp_directory_path() / "junitgrader-policy-XXXXXX").string();

    auto temp_file = linux::mkstemp(path_template);
    if (!temp_file) {
        throw std::system_error(temp_file.error(), "failed to create security policy file");
    }

    // Owns the file from here on, so that it is removed even if writing fails
    SecurityPolicyFile policy_file{temp_file->path};

    auto close_fd = gsl::finally([fd = temp_file->fd] { std::ignore = linux::close(fd); });

    std::string_view remaining = policy;
    while (!remaining.empty()) {
        auto written = linux::write(temp_file->fd, remaining);
        if (!written) {
            throw std::system_error(written.error(), "failed to write security policy file");
        }
        remaining.remove_prefix(static_cast<std::size_t>(*written));
    }

    LOG_DEBUG("Wrote security policy to {}:\n{}", policy_file.get_path().string(), policy);

    return policy_file;
}

SecurityPolicyFile::SecurityPolicyFile(std::filesystem::path path)
    : path_{std::move(path)} {}

SecurityPolicyFile::~SecurityPolicyFile() {
    remove();
}

SecurityPolicyFile::SecurityPolicyFile(SecurityPolicyFile&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

SecurityPolicyFile& SecurityPolicyFile::operator=(SecurityPolicyFile&& rhs) noexcept {
    if (this != &rhs) {
        remove();
        path_ = std::exchange(rhs.path_, {});
    }

    return *this;
}

void SecurityPolicyFile::remove() noexcept {
    if (path_.empty()) {
        return;
    }

    if (auto res = linux::unlink(path_.string()); !res) {
        LOG_WARN("Failed to remove security policy file {}: {}", path_.string(), res.error().message());
    }

    path_.clear();
}

GradingResult<std::optional<SecurityPolicyFile>> make_security_policy(std::string_view classpath, bool active) {
    if (!active) {
        LOG_WARN("Security policy disabled, student code running without restrictions");
        return std::optional<SecurityPolicyFile>{};
    }

    auto policy_file = SecurityPolicyFile::create(classpath);
    if (!policy_file) {
        return policy_file.error();
    }

    return std::optional<SecurityPolicyFile>{std::move(policy_file.value())};
}

} // namespace junitgrader::runner
