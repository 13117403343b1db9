#pragma once

#include <junitgrader/common/expected.hpp>
#include <junitgrader/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace junitgrader::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

namespace detail {

/// The error left in errno by the failed call `name`, logged at debug level
inline std::error_code syscall_error(std::string_view name) {
    std::error_code err = make_error_code(errno);

    LOG_DEBUG("{} failed: {}", name, err.message());

    return err;
}

} // namespace detail

/// see write(2). May write fewer bytes than `data` holds
inline Expected<ssize_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        return detail::syscall_error("write");
    }

    return res;
}

/// reads at most `count` bytes, see read(2)
/// An empty result means end-of-file.
inline Expected<std::string> read(int fd, std::size_t count) {
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        // Not worth logging; the caller polls again
        if (err != std::errc::resource_unavailable_try_again) {
            LOG_DEBUG("read failed: '{}'", err.message());
        }
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        return detail::syscall_error("close");
    }

    return {};
}

inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        return detail::syscall_error("kill");
    }

    return {};
}

/// Executes `file`, searching PATH when it contains no slash. The environment is inherited.
/// args does NOT need to have the program name or an extra NULL element; these are added for you.
/// see execvp(3). Only returns on failure.
inline Expected<> execvp(const std::string& file, const std::vector<std::string>& args) {
    // Reason: execvp requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> cstr_arg_list(args.size() + 2, nullptr);

    auto to_cstr = [](const std::string& str) { return const_cast<char*>(str.c_str()); };

    cstr_arg_list.front() = const_cast<char*>(file.c_str());
    ranges::transform(args, cstr_arg_list.begin() + 1, to_cstr);
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    ::execvp(file.c_str(), cstr_arg_list.data());

    return make_error_code(errno);
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        return detail::syscall_error("fork");
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

inline Expected<> dup2(int oldfd, int newfd) {
    int res = ::dup2(oldfd, newfd);

    if (res != newfd) {
        return detail::syscall_error("dup2");
    }

    return {};
}

/// see fcntl(2)
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        return detail::syscall_error("fcntl");
    }

    return Expected<int>{res};
}

/// see waitid(2)
/// With WNOHANG, a result with `si_pid == 0` means that no child changed state.
inline Expected<siginfo_t> waitid(idtype_t idtype, id_t id, int options = WEXITED) {
    siginfo_t info{};
    int res = ::waitid(idtype, id, &info, options);

    if (res == -1) {
        return detail::syscall_error("waitid");
    }

    return info;
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        return detail::syscall_error("pipe");
    }

    return pipe;
}

/// see poll(2)
/// returns the number of ready descriptors, 0 on timeout
inline Expected<int> poll(std::vector<pollfd>& fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        return detail::syscall_error("poll");
    }

    return res;
}

struct TempFile
{
    int fd;
    std::string path;
};

/// Creates and opens a unique file from `path_template`, which must end in "XXXXXX". See mkstemp(3)
inline Expected<TempFile> mkstemp(std::string path_template) {
    int fd = ::mkstemp(path_template.data());

    if (fd == -1) {
        return detail::syscall_error("mkstemp");
    }

    return TempFile{.fd = fd, .path = std::move(path_template)};
}

inline Expected<> unlink(const std::string& pathname) {
    int res = ::unlink(pathname.c_str());

    if (res == -1) {
        return detail::syscall_error("unlink");
    }

    return {};
}

} // namespace junitgrader::linux
