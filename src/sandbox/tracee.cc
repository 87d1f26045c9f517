#include "tracee.hh"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <linux/securebits.h>
#include <optional>
#include <runjudge/errmsg.hh>
#include <runjudge/file_descriptor.hh>
#include <runjudge/sandbox/sandbox.hh>
#include <string_view>
#include <sys/capability.h>
#include <sys/prctl.h>
#include <unistd.h>
#include <vector>

namespace {

constexpr int spawn_failure_exit_code = 127;

struct Tracee {
    const runjudge::sandbox::Options& options;
    FileDescriptor error_fd;

    std::optional<std::vector<const char*>> argv_holder; // trick to allow noexcept constructor

    template <class... Args>
    // NOLINTNEXTLINE(readability-make-member-function-const)
    [[noreturn]] void die(const Args&... args) noexcept {
        static_assert(sizeof...(Args) > 0, "error message cannot be empty");
        for (auto msg : {std::string_view{args}...}) {
            while (not msg.empty()) {
                auto rc = write(error_fd, msg.data(), msg.size());
                if (rc < 0 and errno == EINTR) {
                    continue;
                }
                if (rc <= 0) {
                    break; // the parent will notice the missing message
                }
                msg.remove_prefix(static_cast<size_t>(rc));
            }
        }
        _exit(spawn_failure_exit_code);
    }

    template <class... Args>
    void die_if_err(bool failed, const Args&... args) noexcept {
        static_assert(
            sizeof...(Args) > 0, "Description of the cause of an error is necessary"
        );
        if (failed) {
            try {
                die(args..., errmsg());
            } catch (...) {
                die(args...);
            }
        }
    }

    void initialize(pid_t parent_pid) noexcept {
        // Become the process group leader, so that the whole group can be killed at once. The
        // parent does the same, whichever is first wins.
        die_if_err(setpgid(0, 0), "setpgid()");
        // Kill us if the judge dies
        die_if_err(prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0), "prctl(PR_SET_PDEATHSIG)");
        // Ensure the judge did not die before we set PR_SET_PDEATHSIG
        if (getppid() != parent_pid) {
            die("judge process died");
        }
    }

    void setup_std_fds() noexcept {
        std::array<int, 3> new_fds = {
            options.new_io_fds.stdin,
            options.new_io_fds.stdout,
            options.new_io_fds.stderr,
        };
        // Move the sources out of the way first, as a source may be one of the targets
        for (auto& fd : new_fds) {
            if (fd < 0) {
                fd = open("/dev/null", O_RDWR | O_CLOEXEC);
                die_if_err(fd < 0, "open(/dev/null)");
            }
            fd = fcntl(fd, F_DUPFD_CLOEXEC, 3);
            die_if_err(fd < 0, "fcntl(F_DUPFD_CLOEXEC)");
        }
        for (int target = 0; target < 3; ++target) {
            // dup2() clears FD_CLOEXEC on the target
            die_if_err(dup2(new_fds[target], target) < 0, "dup2()");
        }
    }

    void change_working_dir() noexcept {
        if (not options.working_dir.empty()) {
            die_if_err(
                chdir(options.working_dir.c_str()), "chdir(", options.working_dir.c_str(), ")"
            );
        }
    }

    void reset_signals() noexcept {
        // Reset blocked signals
        sigset_t sigset;
        die_if_err(sigemptyset(&sigset), "sigemptyset()");
        die_if_err(sigprocmask(SIG_SETMASK, &sigset, nullptr), "sigprocmask()");
        // Reset SIGPIPE (the judge may ignore it, but the program should not inherit that)
        struct sigaction sa {};
        memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_DFL;
        die_if_err(sigaction(SIGPIPE, &sa, nullptr), "sigaction(SIGPIPE)");
    }

    bool has_effective_capability(cap_value_t cap) noexcept {
        cap_t caps = cap_get_proc();
        die_if_err(caps == nullptr, "cap_get_proc()");
        cap_flag_value_t value = CAP_CLEAR;
        die_if_err(cap_get_flag(caps, cap, CAP_EFFECTIVE, &value), "cap_get_flag()");
        die_if_err(cap_free(caps), "cap_free()");
        return value == CAP_SET;
    }

    void drop_capabilities() noexcept {
        // Securebits can be changed only with CAP_SETPCAP
        if (geteuid() == 0 and has_effective_capability(CAP_SETPCAP)) {
            // Without these bits root would regain all capabilities on execve()
            die_if_err(
                cap_set_secbits(
                    SECBIT_NOROOT | SECBIT_NOROOT_LOCKED | SECBIT_NO_CAP_AMBIENT_RAISE |
                    SECBIT_NO_CAP_AMBIENT_RAISE_LOCKED
                ),
                "cap_set_secbits()"
            );
        }
        // Drop all capabilities
        cap_t caps = cap_init();
        die_if_err(caps == nullptr, "cap_init()");
        die_if_err(cap_clear(caps), "cap_clear()");
        die_if_err(cap_set_proc(caps), "cap_set_proc()");
        die_if_err(cap_free(caps), "cap_free()");
        die_if_err(prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0), "prctl(PR_SET_NO_NEW_PRIVS)");
    }

    void prepare_argv() noexcept {
        if (options.args.empty()) {
            die("no program to execute");
        }
        try {
            argv_holder.emplace(options.args.size() + 1);
            for (size_t i = 0; i < options.args.size(); ++i) {
                (*argv_holder)[i] = options.args[i].c_str();
            }
            argv_holder->back() = nullptr;
        } catch (...) {
            die("preparing argv for execvp()", errmsg(ENOMEM));
        }
    }

    [[noreturn]] void execute() noexcept {
        execvp(argv_holder->front(), const_cast<char* const*>(argv_holder->data()));
        die_if_err(true, "execvp(", argv_holder->front(), ")");
        __builtin_unreachable();
    }
};

} // namespace

namespace runjudge::sandbox::tracee {

void execute(const Options& options, FileDescriptor error_fd, pid_t parent_pid) noexcept {
    Tracee tra = {
        .options = options,
        .error_fd = std::move(error_fd),
    };
    tra.initialize(parent_pid);
    tra.setup_std_fds();
    tra.change_working_dir();
    tra.reset_signals();
    if (options.drop_capabilities) {
        tra.drop_capabilities();
    }
    tra.prepare_argv();
    tra.execute();
}

} // namespace runjudge::sandbox::tracee
