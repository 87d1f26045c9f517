#include "supervisor.hh"
#include "tracee.hh"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <runjudge/ctype.hh>
#include <runjudge/errmsg.hh>
#include <runjudge/file_descriptor.hh>
#include <runjudge/macros/throw.hh>
#include <runjudge/sandbox/sandbox.hh>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace runjudge::sandbox {

std::string Result::si_description() const {
    auto signal_description = [](const char* prefix, int signum) {
        auto abbrv = sigabbrev_np(signum);
        auto descr = sigdescr_np(signum);
        if (abbrv) {
            if (descr) {
                return concat_tostr(prefix, " SIG", abbrv, " - ", descr);
            }
            return concat_tostr(prefix, " SIG", abbrv);
        }
        if (descr) {
            return concat_tostr(prefix, " with number ", signum, " - ", descr);
        }
        return concat_tostr(prefix, " with number ", signum);
    };
    switch (si.code) {
    case CLD_EXITED: return concat_tostr("exited with ", si.status);
    case CLD_KILLED: return signal_description("killed by signal", si.status);
    case CLD_DUMPED: return signal_description("killed and dumped by signal", si.status);
    case CLD_TRAPPED: return signal_description("trapped by signal", si.status);
    case CLD_STOPPED: return signal_description("stopped by signal", si.status);
    case CLD_CONTINUED: return signal_description("continued by signal", si.status);
    }
    return "unable to describe";
}

std::vector<std::string> shell_command(std::string command) {
    return {"/bin/sh", "-c", std::move(command)};
}

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> args;
    size_t i = 0;
    while (i < command.size()) {
        while (i < command.size() and is_space(command[i])) {
            ++i;
        }
        size_t beg = i;
        while (i < command.size() and not is_space(command[i])) {
            ++i;
        }
        if (beg < i) {
            args.emplace_back(command, beg, i - beg);
        }
    }
    return args;
}

void kill_process_group(pid_t pgid) noexcept {
    if (pgid <= 0) {
        return; // kill() would signal something else than a single group
    }
    // ESRCH means that the group is already gone, EPERM that the pgid got reused by a process
    // we are not allowed to signal; both leave nothing of ours to kill
    (void)killpg(pgid, SIGKILL);
}

Result execute(const Options& options) {
    auto start_time = std::chrono::steady_clock::now();
    auto error_pipe = pipe2(O_CLOEXEC);
    if (not error_pipe) {
        THROW("pipe2()", errmsg());
    }

    pid_t parent_pid = getpid();
    pid_t pid = fork();
    if (pid == -1) {
        throw SpawnError{concat_tostr("fork()", errmsg())};
    }
    if (pid == 0) {
        (void)error_pipe->readable.close();
        tracee::execute(options, std::move(error_pipe->writable), parent_pid);
        __builtin_unreachable();
    }
    // Parent process
    if (error_pipe->writable.close()) {
        int close_errno = errno;
        (void)kill(pid, SIGKILL); // the group may not exist yet
        kill_process_group(pid);
        (void)waitpid(pid, nullptr, 0);
        THROW("close()", errmsg(close_errno));
    }
    return supervisor::supervise(options, pid, std::move(error_pipe->readable), start_time);
}

} // namespace runjudge::sandbox
