#include "catch2_custom.hpp"

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/subprocess/run_result.hpp>
#include <junitgrader/subprocess/subprocess.hpp>

#include <fmt/format.h>

#include <chrono>
#include <limits>
#include <string>
#include <utility>

#include <signal.h>
#include <sys/wait.h>

using junitgrader::ErrorKind;
using junitgrader::RunResult;
using junitgrader::Subprocess;

TEST_CASE("Read /bin/echo stdout") {
    Subprocess proc("/bin/echo", {"-n", "Hello", "world!"});
    REQUIRE(proc.start());

    auto run_res = proc.wait_for_exit();

    REQUIRE(run_res);
    REQUIRE(*run_res == RunResult::make_exited(0));
    REQUIRE(run_res->is_success());
    REQUIRE(proc.get_stdout() == "Hello world!");
    REQUIRE(proc.get_stderr().empty());
    REQUIRE(proc.get_exit_code() == 0);
}

TEST_CASE("Executable is searched for on PATH") {
    Subprocess proc("sh", {"-c", "echo found"});
    REQUIRE(proc.start());

    REQUIRE(proc.wait_for_exit());
    REQUIRE(proc.get_stdout() == "found\n");
}

TEST_CASE("Capture stderr and the exit code separately") {
    Subprocess proc("/bin/sh", {"-c", "echo out; echo err >&2; exit 3"});
    REQUIRE(proc.start());

    auto run_res = proc.wait_for_exit();

    REQUIRE(run_res);
    REQUIRE(run_res->get_kind() == RunResult::Kind::Exited);
    REQUIRE(run_res->get_code() == 3);
    REQUIRE_FALSE(run_res->is_success());

    REQUIRE(proc.get_stdout() == "out\n");
    REQUIRE(proc.get_stderr() == "err\n");
}

TEST_CASE("Output larger than a pipe buffer is collected") {
    Subprocess proc("/bin/sh", {"-c", "head -c 200000 /dev/zero | tr '\\0' x"});
    REQUIRE(proc.start());

    REQUIRE(proc.wait_for_exit());
    REQUIRE(proc.get_stdout() == std::string(200000, 'x'));
}

TEST_CASE("Child stdin is empty") {
    Subprocess proc("/bin/cat", {});
    REQUIRE(proc.start());

    auto run_res = proc.wait_for_exit(std::chrono::seconds{5});

    REQUIRE(run_res);
    REQUIRE(run_res->is_success());
    REQUIRE(proc.get_stdout().empty());
}

TEST_CASE("Child is killed when the timeout expires") {
    using namespace std::chrono_literals;

    Subprocess proc("/bin/sh", {"-c", "echo started; exec sleep 30"});
    REQUIRE(proc.start());

    auto start = std::chrono::steady_clock::now();
    auto run_res = proc.wait_for_exit(200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(run_res);
    REQUIRE(run_res.error() == ErrorKind::TimedOut);
    REQUIRE(elapsed < 10s);

    REQUIRE_FALSE(proc.is_alive());
    REQUIRE(proc.get_stdout() == "started\n");
}

TEST_CASE("Manually kill a child") {
    Subprocess proc("/bin/sleep", {"30"});
    REQUIRE(proc.start());
    REQUIRE(proc.is_alive());

    REQUIRE(proc.kill());

    REQUIRE_FALSE(proc.is_alive());
}

TEST_CASE("Killed by a signal") {
    Subprocess proc("/bin/sh", {"-c", "kill -TERM $$"});
    REQUIRE(proc.start());

    auto run_res = proc.wait_for_exit();

    REQUIRE(run_res);
    REQUIRE(*run_res == RunResult::make_killed(SIGTERM));
    REQUIRE_FALSE(run_res->is_success());
}

TEST_CASE("Failing to exec exits with a distinct code") {
    Subprocess proc("/this/does/not/exist", {});
    REQUIRE(proc.start());

    auto run_res = proc.wait_for_exit();

    REQUIRE(run_res);
    REQUIRE(*run_res == RunResult::make_exited(Subprocess::EXEC_FAILURE_EXIT_CODE));
}

TEST_CASE("Moved-from subprocess does not own the child") {
    Subprocess proc("/bin/sleep", {"30"});
    REQUIRE(proc.start());

    Subprocess other{std::move(proc)};

    REQUIRE(other.is_alive());
    REQUIRE(other.kill());
}

TEST_CASE("RunResult from waitid state changes") {
    siginfo_t info{};

    info.si_code = CLD_EXITED;
    info.si_status = 2;
    REQUIRE(RunResult::from_siginfo(info) == RunResult::make_exited(2));
    REQUIRE_FALSE(RunResult::from_siginfo(info).is_success());

    info.si_code = CLD_KILLED;
    info.si_status = SIGKILL;
    REQUIRE(RunResult::from_siginfo(info) == RunResult::make_killed(SIGKILL));

    info.si_code = CLD_DUMPED;
    info.si_status = SIGSEGV;
    REQUIRE(RunResult::from_siginfo(info).get_kind() == RunResult::Kind::Killed);
}

TEST_CASE("RunResult descriptions") {
    REQUIRE(fmt::format("{}", RunResult::make_exited(0)) == "exited with status 0");
    REQUIRE_THAT(fmt::format("{}", RunResult::make_killed(SIGKILL)),
                 Catch::Matchers::StartsWith("killed by signal 9 ("));
}

TEST_CASE("Poll timeouts saturate instead of wrapping") {
    using namespace std::chrono_literals;

    REQUIRE(Subprocess::to_poll_timeout(0ms) == 0);
    REQUIRE(Subprocess::to_poll_timeout(250ms) == 250);

    // About 34 days, more milliseconds than an int holds
    REQUIRE(Subprocess::to_poll_timeout(std::chrono::seconds{3'000'000}) == std::numeric_limits<int>::max());
}
