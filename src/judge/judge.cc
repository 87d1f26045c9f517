#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <optional>
#include <runjudge/errmsg.hh>
#include <runjudge/file_descriptor.hh>
#include <runjudge/judge/compare.hh>
#include <runjudge/judge/judge.hh>
#include <runjudge/judge/language.hh>
#include <runjudge/macros/throw.hh>
#include <runjudge/sandbox/sandbox.hh>
#include <string_view>
#include <sys/wait.h>
#include <utility>

using std::string;

namespace runjudge::judge {

namespace {

using Score = Verdict::Score;

Verdict compilation_error() {
    return {
        .result = "Compilation Error",
        .exit_status = EXIT_FAILURE,
        .score = Score::CompilerError,
    };
}

Verdict execution_error(int exit_status = EXIT_FAILURE) {
    return {
        .result = "Execution Error",
        .exit_status = exit_status,
        .score = Score::ExecutionError,
    };
}

struct Judge {
    const JudgeRequest& request;
    Logger& logger;

    // Paths made independent of the working directory of the compiler and the program
    string source = std::filesystem::absolute(request.source).string();
    string input = std::filesystem::absolute(request.input).string();
    string expected_output = std::filesystem::absolute(request.expected_output).string();
    string capture_path = concat_tostr(request.working_dir, '/', capture_file_name);
    string executable{executable_name(source)};

    template <class... Args>
    void debuglog(Args&&... args) {
        if (request.verbose) {
            logger(std::forward<Args>(args)...);
        }
    }

    static auto in_millis(std::chrono::nanoseconds time) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time).count();
    }

    // Returns std::nullopt if the program is ready to be executed
    std::optional<Verdict> compile(const Language& language) {
        // Opened even if there is nothing to compile, so that no stale output is kept
        FileDescriptor capture_fd{capture_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC};
        if (not capture_fd.is_open()) {
            THROW("open(", capture_path, ")", errmsg());
        }
        if (not language.is_compiled()) {
            return std::nullopt;
        }

        auto command = format_command(language.compile, source, executable);
        debuglog("Compiling ", source, "... (", command, ')');
        sandbox::Result res;
        try {
            res = sandbox::execute({
                .new_io_fds =
                    {
                        .stdin = -1,
                        .stdout = capture_fd,
                        .stderr = capture_fd,
                    },
                .time_limit = request.compile_time_limit,
                .working_dir = request.working_dir,
                .args = sandbox::shell_command(std::move(command)),
            });
        } catch (const sandbox::SpawnError& e) {
            debuglog("Compiler could not be started: ", e.what());
            return compilation_error();
        }

        debuglog("Compiler ", res.si_description(), " after ", in_millis(res.runtime), " ms");
        if (res.timed_out) {
            debuglog("Compilation time limit exceeded");
            return compilation_error();
        }
        if (not res.exited_normally()) {
            return compilation_error();
        }
        return std::nullopt;
    }

    // Returns std::nullopt if the program exited successfully within the time limit
    std::optional<Verdict> execute(const Language& language) {
        FileDescriptor capture_fd{capture_path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC};
        if (not capture_fd.is_open()) {
            THROW("open(", capture_path, ")", errmsg());
        }
        FileDescriptor input_fd{input.c_str(), O_RDONLY | O_CLOEXEC};
        if (not input_fd.is_open()) {
            THROW("open(", input, ")", errmsg());
        }

        auto command = format_command(language.execute, source, executable);
        debuglog("Executing ", executable, "... (", command, ')');
        sandbox::Result res;
        try {
            res = sandbox::execute({
                .new_io_fds =
                    {
                        .stdin = input_fd,
                        .stdout = capture_fd,
                        .stderr = -1,
                    },
                .time_limit = request.time_limit,
                .working_dir = request.working_dir,
                .drop_capabilities = true,
                .args = sandbox::split_command(command),
            });
        } catch (const sandbox::SpawnError& e) {
            debuglog("Program could not be started: ", e.what());
            return execution_error();
        }

        debuglog("Program ", res.si_description(), " after ", in_millis(res.runtime), " ms");
        if (res.timed_out) {
            return Verdict{
                .result = "Time Limit Exceeded",
                .exit_status = EXIT_FAILURE,
                .score = Score::TimeLimitExceeded,
            };
        }
        if (res.si.code == CLD_EXITED) {
            if (res.si.status != 0) {
                return execution_error(res.si.status);
            }
            return std::nullopt;
        }
        // Killed by a signal, there is no exit code to pass on
        return execution_error();
    }

    Verdict compare() {
        debuglog("Comparing ", capture_path, " with ", expected_output);
        switch (compare_files(capture_path, expected_output)) {
        case Comparison::WrongAnswer:
            return {
                .result = "Wrong Answer",
                .exit_status = EXIT_FAILURE,
                .score = Score::WrongAnswer,
            };
        case Comparison::FormatMismatch:
            return {
                .result = "Output Format Error",
                .exit_status = EXIT_FAILURE,
                .score = Score::WrongFormatting,
            };
        case Comparison::ExactMatch:
            return {
                .result = "Success",
                .exit_status = EXIT_SUCCESS,
                .score = Score::ProgramSuccess,
            };
        }
        THROW("invalid comparison result");
    }

    Verdict run() {
        const Language* language = nullptr;
        try {
            std::optional<std::string_view> language_name;
            if (request.language_name) {
                language_name = *request.language_name;
            }
            language = &resolve_language(request.source, language_name);
        } catch (const UnsupportedLanguage& e) {
            return {.result = e.what(), .exit_status = EXIT_FAILURE, .score = Score::CompilerError};
        }
        debuglog("Language: ", language->name);

        if (auto verdict = compile(*language)) {
            return std::move(*verdict);
        }
        if (auto verdict = execute(*language)) {
            return std::move(*verdict);
        }
        return compare();
    }
};

} // namespace

Verdict judge(const JudgeRequest& request, Logger& logger) {
    return Judge{.request = request, .logger = logger}.run();
}

} // namespace runjudge::judge
