#pragma once

#include <chrono>
#include <csignal>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

namespace runjudge::sandbox {

// Interval at which the supervisor re-checks the deadline while waiting for the child
constexpr inline auto poll_interval = std::chrono::milliseconds{250};

struct Options {
    struct NewIOFileDescriptors {
        int stdin = STDIN_FILENO; // if negative, use /dev/null
        int stdout = STDOUT_FILENO; // if negative, use /dev/null
        int stderr = STDERR_FILENO; // if negative, use /dev/null
    } new_io_fds;

    // Real time limit for the whole process group; if not set, wait indefinitely
    std::optional<std::chrono::nanoseconds> time_limit;
    // Directory in which the executable is run; if empty, the current one is kept
    std::string working_dir;
    // Drop all capabilities and set no_new_privs before executing the program
    bool drop_capabilities = false;

    // Program arguments (same as for execve()), args[0] is looked up in PATH if it has no '/'
    std::vector<std::string> args;
};

struct Result {
    struct Si {
        int code; // siginfo_t::si_code of the root process (CLD_EXITED, CLD_KILLED, ...)
        int status; // siginfo_t::si_status of the root process

        bool operator==(const Si&) const = default;
    } si{};

    // Runtime (real time) of the root process
    std::chrono::nanoseconds runtime{0};
    // Whether the time limit was reached and the process group was killed because of it
    bool timed_out = false;

    [[nodiscard]] bool exited_normally() const noexcept {
        return si.code == CLD_EXITED and si.status == 0;
    }

    // Returns textual description of si field
    [[nodiscard]] std::string si_description() const;
};

// Thrown if the program could not be started at all
class SpawnError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Returns arguments that make /bin/sh run @p command
std::vector<std::string> shell_command(std::string command);

// Splits @p command on whitespace, there is no quoting
std::vector<std::string> split_command(const std::string& command);

// Runs options.args in a new process group and waits for it to exit or reach the time limit.
// Whatever happens, the whole process group is killed before returning. Throws SpawnError if
// the program could not be started and std::runtime_error on other errors.
Result execute(const Options& options);

// Sends SIGKILL to process group @p pgid; a group that no longer exists is not an error
void kill_process_group(pid_t pgid) noexcept;

} // namespace runjudge::sandbox
