#include <junitgrader/subprocess/subprocess.hpp>

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/common/expected.hpp>
#include <junitgrader/common/linux.hpp>
#include <junitgrader/logging.hpp>
#include <junitgrader/subprocess/run_result.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace junitgrader {

Subprocess::Subprocess(std::string exec, std::vector<std::string> args)
    : exec_{std::move(exec)}
    , args_{std::move(args)} {}

Subprocess::~Subprocess() {
    if (is_alive()) {
        std::ignore = kill();
    }

    std::ignore = close_pipes();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : child_pid_{std::exchange(other.child_pid_, 0)}
    , reaped_{std::exchange(other.reaped_, false)}
    , stdin_pipe_{std::exchange(other.stdin_pipe_, CLOSED_PIPE)}
    , stdout_pipe_{std::exchange(other.stdout_pipe_, CLOSED_PIPE)}
    , stderr_pipe_{std::exchange(other.stderr_pipe_, CLOSED_PIPE)}
    , stdout_buffer_{std::move(other.stdout_buffer_)}
    , stderr_buffer_{std::move(other.stderr_buffer_)}
    , run_result_{std::exchange(other.run_result_, std::nullopt)}
    , exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    if (is_alive()) {
        std::ignore = kill();
    }
    std::ignore = close_pipes();

    child_pid_ = std::exchange(rhs.child_pid_, 0);
    reaped_ = std::exchange(rhs.reaped_, false);
    stdin_pipe_ = std::exchange(rhs.stdin_pipe_, CLOSED_PIPE);
    stdout_pipe_ = std::exchange(rhs.stdout_pipe_, CLOSED_PIPE);
    stderr_pipe_ = std::exchange(rhs.stderr_pipe_, CLOSED_PIPE);
    stdout_buffer_ = std::move(rhs.stdout_buffer_);
    stderr_buffer_ = std::move(rhs.stderr_buffer_);
    run_result_ = std::exchange(rhs.run_result_, std::nullopt);
    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);

    return *this;
}

Result<void> Subprocess::start() {
    DEBUG_ASSERT(child_pid_ == 0, "Subprocess started more than once");

    LOG_DEBUG("Starting subprocess: {} {}", exec_, fmt::join(args_, " "));

    return create(exec_, args_);
}

bool Subprocess::is_alive() const {
    return child_pid_ != 0 && !reaped_;
}

std::optional<int> Subprocess::get_exit_code() const {
    if (!run_result_ || run_result_->get_kind() != RunResult::Kind::Exited) {
        return std::nullopt;
    }

    return run_result_->get_code();
}

Result<RunResult> Subprocess::wait_for_exit(std::optional<std::chrono::milliseconds> timeout) {
    using namespace std::chrono_literals;
    using std::chrono::steady_clock;

    DEBUG_ASSERT(child_pid_ != 0, "wait_for_exit called on a subprocess that was never started");

    if (run_result_) {
        return *run_result_;
    }

    std::optional<steady_clock::time_point> deadline;
    if (timeout) {
        deadline = steady_clock::now() + *timeout;
    }

    auto timed_out = [this]() -> Result<RunResult> {
        LOG_DEBUG("Subprocess {} timed out; killing it", child_pid_);
        TRY(kill());
        return ErrorKind::TimedOut;
    };

    // Keep reading until the child (and anything it spawned) closes its output
    while (stdout_pipe_.read_fd != -1 || stderr_pipe_.read_fd != -1) {
        int poll_timeout_ms = -1;

        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - steady_clock::now());
            if (remaining <= 0ms) {
                return timed_out();
            }
            poll_timeout_ms = to_poll_timeout(remaining);
        }

        TRY(pump_pipes(poll_timeout_ms));
    }

    if (!deadline) {
        auto res = TRY(reap(WEXITED));
        ASSERT(res.has_value(), "Blocking waitid returned without a state change");

        return *res;
    }

    // Output is closed, but the child itself may still be running
    static constexpr auto REAP_POLL_INTERVAL = 5ms;
    while (true) {
        auto res = TRY(reap(WEXITED | WNOHANG));

        if (res) {
            return *res;
        }

        if (steady_clock::now() >= *deadline) {
            return timed_out();
        }

        std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }
}

int Subprocess::to_poll_timeout(std::chrono::milliseconds remaining) {
    // The loop polls again with whatever is left once a saturated wait ends
    const auto clamped = std::clamp<std::chrono::milliseconds::rep>(remaining.count(), 0,
                                                                    std::numeric_limits<int>::max());

    return gsl::narrow_cast<int>(clamped);
}

Result<void> Subprocess::kill() {
    if (!is_alive()) {
        return {};
    }

    TRYE(linux::kill(child_pid_, SIGKILL), SyscallFailure);

    // Blocking; the child cannot survive SIGKILL
    auto res = TRY(reap(WEXITED));
    ASSERT(res.has_value(), "Blocking waitid returned without a state change");

    return close_pipes();
}

Result<std::optional<RunResult>> Subprocess::reap(int options) {
    siginfo_t info = TRYE(linux::waitid(P_PID, static_cast<id_t>(child_pid_), options), SyscallFailure);

    // Only possible with WNOHANG
    if (info.si_pid == 0) {
        return std::optional<RunResult>{};
    }

    reaped_ = true;
    run_result_ = RunResult::from_siginfo(info);

    LOG_DEBUG("Subprocess {} terminated: {}", child_pid_, *run_result_);

    return run_result_;
}

Result<void> Subprocess::pump_pipes(int timeout_ms) {
    std::vector<pollfd> poll_fds;

    for (const linux::Pipe* pipe : {&stdout_pipe_, &stderr_pipe_}) {
        if (pipe->read_fd != -1) {
            poll_fds.push_back({.fd = pipe->read_fd, .events = POLLIN, .revents = 0});
        }
    }

    auto poll_res = linux::poll(poll_fds, timeout_ms);

    if (!poll_res) {
        // Interrupted by a signal; the caller re-checks its deadline and polls again
        if (poll_res.error() == std::errc::interrupted) {
            return {};
        }
        LOG_WARN("Error polling subprocess output pipes: '{}'", poll_res.error().message());
        return ErrorKind::SyscallFailure;
    }

    if (poll_res.value() == 0) {
        return {};
    }

    TRY(drain_pipe(stdout_pipe_, stdout_buffer_));
    TRY(drain_pipe(stderr_pipe_, stderr_buffer_));

    return {};
}

Result<void> Subprocess::drain_pipe(linux::Pipe& pipe, std::string& buffer) {
    while (pipe.read_fd != -1) {
        auto read_res = linux::read(pipe.read_fd, READ_CHUNK_SIZE);

        if (!read_res) {
            const std::error_code& err = read_res.error();

            if (err == std::errc::resource_unavailable_try_again || err == std::errc::interrupted) {
                return {};
            }

            return ErrorKind::SyscallFailure;
        }

        // EOF
        if (read_res->empty()) {
            TRYE(linux::close(pipe.read_fd), SyscallFailure);
            pipe.read_fd = -1;
            break;
        }

        buffer += *read_res;
    }

    return {};
}

Result<void> Subprocess::close_pipes() {
    for (linux::Pipe* pipe : {&stdin_pipe_, &stdout_pipe_, &stderr_pipe_}) {
        for (int* fd : {&pipe->read_fd, &pipe->write_fd}) {
            if (*fd != -1) {
                // The descriptor is invalid after close(2) even when it fails
                int to_close = std::exchange(*fd, -1);
                TRYE(linux::close(to_close), SyscallFailure);
            }
        }
    }

    return {};
}

Result<void> Subprocess::create(const std::string& exec, const std::vector<std::string>& args) {
    // O_CLOEXEC so that no pipe end leaks into the child past exec, other than the dup'ed ones
    stdin_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stdout_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stderr_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    // Child process
    if (fork_res.which == linux::Fork::Child) {
        if (init_child()) {
            auto exec_res = linux::execvp(exec, args);

            // stderr is the pipe to the parent at this point
            std::ignore = linux::write(STDERR_FILENO, fmt::format("failed to execute {}: {}\n", exec,
                                                                  exec_res.error().message()));
        }

        // Never return into the parent's code from the child
        _exit(EXEC_FAILURE_EXIT_CODE);
    }

    // Parent process
    child_pid_ = fork_res.pid;

    return init_parent();
}

Result<void> Subprocess::init_child() {
    TRYE(linux::dup2(stdin_pipe_.read_fd, STDIN_FILENO), SyscallFailure);
    TRYE(linux::dup2(stdout_pipe_.write_fd, STDOUT_FILENO), SyscallFailure);
    TRYE(linux::dup2(stderr_pipe_.write_fd, STDERR_FILENO), SyscallFailure);

    return {};
}

Result<void> Subprocess::init_parent() {
    // Close the pipe ends being used in the child proc
    //  - read end for stdin
    //  - write ends for stdout and stderr
    // and the write end of stdin, so that the child reads EOF immediately
    for (int* fd : {&stdin_pipe_.read_fd, &stdin_pipe_.write_fd, &stdout_pipe_.write_fd, &stderr_pipe_.write_fd}) {
        int to_close = std::exchange(*fd, -1);
        TRYE(linux::close(to_close), SyscallFailure);
    }

    // Make reading from stdout and stderr non-blocking
    for (int read_fd : {stdout_pipe_.read_fd, stderr_pipe_.read_fd}) {
        int pre_flags = TRYE(linux::fcntl(read_fd, F_GETFL), SyscallFailure);

        TRYE(linux::fcntl(read_fd, F_SETFL, pre_flags | O_NONBLOCK), // NOLINT
             SyscallFailure);
    }

    return {};
}

} // namespace junitgrader
