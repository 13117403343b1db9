#pragma once

#include <junitgrader/common/class_traits.hpp>
#include <junitgrader/common/error_types.hpp>
#include <junitgrader/common/linux.hpp>
#include <junitgrader/subprocess/run_result.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace junitgrader {

/// A child process running ``exec`` (searched for on PATH) with ``args``, with its stdout and stderr captured.
/// The child inherits the environment and the working directory, and its stdin is empty.
///
/// A child that is still running when the object is destroyed is killed and reaped.
class Subprocess : NonCopyable
{
public:
    explicit Subprocess(std::string exec, std::vector<std::string> args);
    ~Subprocess();
    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& rhs) noexcept;

    /// Forks the current process to start the child process
    Result<void> start();

    /// Blocks until the child exits, collecting all of its output.
    ///
    /// If ``timeout`` is given and expires first, the child is killed and reaped, and
    /// ErrorKind::TimedOut is returned. Output collected up to that point stays available.
    Result<RunResult> wait_for_exit(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Manually kill the child with SIGKILL and reap it
    Result<void> kill();

    /// Whether the child has been started and not yet reaped
    bool is_alive() const;

    const std::string& get_stdout() const { return stdout_buffer_; }

    const std::string& get_stderr() const { return stderr_buffer_; }

    pid_t get_pid() const { return child_pid_; }

    std::optional<int> get_exit_code() const;

    /// Exit status of a child whose exec failed
    static constexpr int EXEC_FAILURE_EXIT_CODE = 127;

    /// ``remaining`` as a poll(2) timeout, saturated at the largest timeout poll accepts
    static int to_poll_timeout(std::chrono::milliseconds remaining);

private:
    Result<void> create(const std::string& exec, const std::vector<std::string>& args);

    Result<void> init_child();
    Result<void> init_parent();

    /// Waits up to ``timeout_ms`` (forever if negative) for output, then reads everything available
    Result<void> pump_pipes(int timeout_ms);

    /// Reads from a non-blocking pipe until it would block. Closes the pipe on EOF.
    static Result<void> drain_pipe(linux::Pipe& pipe, std::string& buffer);

    Result<void> close_pipes();

    /// Waits for the child with waitid(2) ``options``. Empty if WNOHANG was given and the child is still running.
    Result<std::optional<RunResult>> reap(int options);

    static constexpr std::size_t READ_CHUNK_SIZE = 4096;

    static constexpr linux::Pipe CLOSED_PIPE{.read_fd = -1, .write_fd = -1};

    pid_t child_pid_{};
    bool reaped_{};

    /// The parent process only makes use of the read ends of stdout_pipe_ and stderr_pipe_
    linux::Pipe stdin_pipe_ = CLOSED_PIPE;
    linux::Pipe stdout_pipe_ = CLOSED_PIPE;
    linux::Pipe stderr_pipe_ = CLOSED_PIPE;

    std::string stdout_buffer_;
    std::string stderr_buffer_;

    std::optional<RunResult> run_result_;

    std::string exec_;
    std::vector<std::string> args_;
};

} // namespace junitgrader
