#pragma once

#include <fmt/format.h>

#include <string>

#include <signal.h>

namespace junitgrader {

/// How a child process terminated
class RunResult
{
public:
    enum class Kind {
        Exited, ///< Normal exit; code is the exit status
        Killed  ///< Terminated by a signal; code is the signal number
    };

    static RunResult make_exited(int code) { return {Kind::Exited, code}; }
    static RunResult make_killed(int code) { return {Kind::Killed, code}; }

    /// From the state change reported by waitid(2) for a terminated child
    static RunResult from_siginfo(const siginfo_t& info);

    Kind get_kind() const { return kind_; }
    int get_code() const { return code_; }

    /// Exited with a status of 0
    bool is_success() const { return kind_ == Kind::Exited && code_ == 0; }

    /// `exited with status N` or `killed by signal N (description)`
    std::string describe() const;

    bool operator==(const RunResult& rhs) const = default;

private:
    RunResult(Kind kind, int code)
        : kind_{kind}
        , code_{code} {}

    Kind kind_;
    int code_;
};

} // namespace junitgrader

template <>
struct fmt::formatter<::junitgrader::RunResult> : fmt::formatter<std::string>
{
    auto format(const ::junitgrader::RunResult& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(from.describe(), ctx);
    }
};
