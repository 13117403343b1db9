#include <junitgrader/subprocess/run_result.hpp>

#include <fmt/format.h>

#include <cstring>
#include <string>

#include <signal.h>
#include <sys/wait.h>

namespace junitgrader {

RunResult RunResult::from_siginfo(const siginfo_t& info) {
    if (info.si_code == CLD_EXITED) {
        return make_exited(info.si_status);
    }

    // CLD_KILLED or CLD_DUMPED; si_status holds the signal
    return make_killed(info.si_status);
}

std::string RunResult::describe() const {
    if (kind_ == Kind::Exited) {
        return fmt::format("exited with status {}", code_);
    }

    const char* signal_name = ::strsignal(code_);

    return fmt::format("killed by signal {} ({})", code_, signal_name != nullptr ? signal_name : "unknown signal");
}

} // namespace junitgrader
