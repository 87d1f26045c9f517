#include "supervisor.hh"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <optional>
#include <poll.h>
#include <runjudge/errmsg.hh>
#include <runjudge/file_descriptor.hh>
#include <runjudge/macros/throw.hh>
#include <runjudge/sandbox/sandbox.hh>
#include <runjudge/syscalls.hh>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

using std::chrono::steady_clock;

namespace {

struct Supervisor {
    const runjudge::sandbox::Options& options;

    // The root process of the supervised group
    struct Tracee {
        // State automaton:
        //                        deadline reached or tracee died
        // --> RUNNING ----------------------------------------------> UNWAITED
        //        |                 kill_tracee_group()                   |
        //        |                                                       | waitid_tracee()
        //        `------------------> (destructor) <----------------- WAITED
        enum State {
            RUNNING, // alive or dead, but its group was not killed yet
            UNWAITED, // group killed but the root not waited
            WAITED, // dead and waited
        } state = RUNNING;
        pid_t pid = 0;
        FileDescriptor pidfd; // optional, allows waking up exactly when the tracee dies
        siginfo_t si{};
    } tracee;

    steady_clock::time_point start_time;
    std::optional<steady_clock::time_point> deadline;

    Supervisor(
        const runjudge::sandbox::Options& options, pid_t pid, steady_clock::time_point start_time
    ) noexcept
    : options{options}
    , start_time{start_time} {
        tracee.pid = pid;
        if (options.time_limit) {
            // Saturate instead of overflowing
            if (*options.time_limit >= steady_clock::time_point::max() - start_time) {
                deadline = steady_clock::time_point::max();
            } else {
                deadline = start_time + *options.time_limit;
            }
        }
    }

    Supervisor(const Supervisor&) = delete;
    Supervisor(Supervisor&&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;
    Supervisor& operator=(Supervisor&&) = delete;

    // Nothing may outlive the supervisor, even if an exception is being propagated
    ~Supervisor() {
        if (tracee.state == Tracee::RUNNING) {
            kill_tracee_group();
        }
        if (tracee.state == Tracee::UNWAITED) {
            (void)waitid_tracee();
        }
    }

    void kill_tracee_group() noexcept {
        runjudge::sandbox::kill_process_group(tracee.pid);
        tracee.state = Tracee::UNWAITED;
    }

    [[nodiscard]] int waitid_tracee() noexcept {
        int rc = 0;
        do {
            rc = waitid(P_PID, tracee.pid, &tracee.si, WEXITED);
        } while (rc == -1 and errno == EINTR);
        tracee.state = Tracee::WAITED;
        return rc;
    }

    void ensure_process_group() noexcept {
        // The tracee does the same; here it is to have the group before anyone may signal it.
        // It fails with EACCES if the tracee has already executed the program, which means
        // it has already set its group itself.
        (void)setpgid(tracee.pid, tracee.pid);
    }

    // Returns the error message sent by the tracee or an empty string if the program was
    // executed successfully (the pipe got closed on exec)
    static std::string receive_spawn_error(FileDescriptor& error_fd) {
        std::string msg;
        char buff[4096];
        for (;;) {
            auto rc = read(error_fd, buff, sizeof(buff));
            if (rc == 0) {
                break;
            }
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                THROW("read()", errmsg());
            }
            msg.append(buff, static_cast<size_t>(rc));
        }
        if (error_fd.close()) {
            THROW("close()", errmsg());
        }
        return msg;
    }

    void open_pidfd() noexcept {
#ifdef SYS_pidfd_open
        tracee.pidfd = syscalls::pidfd_open(tracee.pid, 0);
        // Without pidfd (old kernel) we just wake up every poll_interval
#endif
    }

    // Returns true iff the tracee has died; it stays unwaited, so its pid and process group id
    // cannot be reused before the group is killed
    bool tracee_died() {
        siginfo_t si{};
        si.si_pid = 0;
        if (waitid(P_PID, tracee.pid, &si, WEXITED | WNOHANG | WNOWAIT)) {
            THROW("waitid()", errmsg());
        }
        return si.si_pid == tracee.pid;
    }

    // Returns true iff the deadline was reached before the tracee died
    bool wait_for_tracee() {
        for (;;) {
            if (tracee_died()) {
                return false;
            }
            auto now = steady_clock::now();
            if (deadline and now >= *deadline) {
                return true;
            }

            auto timeout = std::chrono::milliseconds{runjudge::sandbox::poll_interval};
            if (deadline) {
                timeout = std::min(
                    timeout, std::chrono::ceil<std::chrono::milliseconds>(*deadline - now)
                );
            }
            pollfd pfd = {
                .fd = tracee.pidfd,
                .events = POLLIN,
                .revents = 0,
            };
            int rc = poll(&pfd, tracee.pidfd.is_open() ? 1 : 0, static_cast<int>(timeout.count()));
            if (rc == -1 and errno != EINTR) {
                THROW("poll()", errmsg());
            }
        }
    }

    runjudge::sandbox::Result run(FileDescriptor error_fd) {
        ensure_process_group();
        auto spawn_error = receive_spawn_error(error_fd);
        if (not spawn_error.empty()) {
            kill_tracee_group();
            if (waitid_tracee()) {
                THROW("waitid()", errmsg());
            }
            throw runjudge::sandbox::SpawnError{spawn_error};
        }

        open_pidfd();
        runjudge::sandbox::Result res;
        res.timed_out = wait_for_tracee();
        res.runtime = steady_clock::now() - start_time;
        // Descendants of the tracee may still be alive, regardless of why we stopped waiting
        kill_tracee_group();
        if (waitid_tracee()) {
            THROW("waitid()", errmsg());
        }
        res.si = {
            .code = tracee.si.si_code,
            .status = tracee.si.si_status,
        };
        return res;
    }
};

} // namespace

namespace runjudge::sandbox::supervisor {

Result supervise(
    const Options& options, pid_t pid, FileDescriptor error_fd, steady_clock::time_point start_time
) {
    Supervisor sup{options, pid, start_time};
    return sup.run(std::move(error_fd));
}

} // namespace runjudge::sandbox::supervisor
