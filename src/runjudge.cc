#include <charconv>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <runjudge/argv_parser.hh>
#include <runjudge/judge/judge.hh>
#include <runjudge/judge/verdict.hh>
#include <runjudge/logger.hh>
#include <string>
#include <string_view>
#include <vector>

using runjudge::judge::JudgeRequest;
using runjudge::judge::Verdict;

namespace {

constexpr int usage_exit_code = 2;

void print_usage(FILE* stream, const char* program_name) {
    (void)fprintf(
        stream,
        "Usage: %s [-d DIR] [-l LANGUAGE] [-t SECONDS] [-c SECONDS] [-v] source input output\n"
        "\n"
        "Compiles and runs source on input and compares its output with output. Prints the\n"
        "verdict as a JSON object {\"result\": ..., \"score\": ...}.\n"
        "\n"
        "Options:\n"
        "\n"
        "    -d DIR       Run in directory DIR, artifacts are placed there (default is .)\n"
        "    -l LANGUAGE  Also accept the language named LANGUAGE (case-insensitive); the first\n"
        "                 language matching either the source extension or LANGUAGE is used\n"
        "    -t SECONDS   Timeout duration before killing the program (default is %lld seconds)\n"
        "    -c SECONDS   Timeout duration before killing the compiler (default is %lld seconds)\n"
        "    -v           Display verbose debugging output\n"
        "    -h           Display this help\n",
        program_name,
        static_cast<long long>(runjudge::judge::default_time_limit.count()),
        static_cast<long long>(runjudge::judge::default_compile_time_limit.count())
    );
}

template <class... Args>
[[noreturn]] void usage_error(const char* program_name, Args&&... args) {
    errlog.label(false);
    errlog("Error: ", std::forward<Args>(args)...);
    print_usage(stderr, program_name);
    std::exit(usage_exit_code);
}

std::optional<std::chrono::seconds> parse_seconds(std::string_view str) {
    long long val = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), val);
    if (ec != std::errc{} or ptr != str.data() + str.size() or val <= 0 or
        val > runjudge::judge::max_time_limit.count())
    {
        return std::nullopt;
    }
    return std::chrono::seconds{val};
}

JudgeRequest parse_arguments(int argc, char** argv) {
    const char* program_name = (argc > 0 ? argv[0] : "runjudge");
    JudgeRequest request;
    std::vector<std::string_view> positional;

    ArgvParser args(argc - 1, argv + 1);
    auto option_value = [&](std::string_view option) {
        if (args.size() == 0) {
            usage_error(program_name, "option ", option, " requires a value");
        }
        return args.extract_next();
    };
    auto seconds_value = [&](std::string_view option) {
        auto value = option_value(option);
        auto seconds = parse_seconds(value);
        if (not seconds) {
            usage_error(
                program_name,
                "invalid number of seconds for ",
                option,
                ": '",
                value,
                "' (expected an integer from 1 to ",
                runjudge::judge::max_time_limit.count(),
                ')'
            );
        }
        return *seconds;
    };

    while (args.size() > 0) {
        auto arg = args.extract_next();
        if (arg.size() < 2 or arg[0] != '-') {
            positional.emplace_back(arg);
        } else if (arg == "-d") {
            request.working_dir = option_value(arg);
        } else if (arg == "-l") {
            request.language_name = std::string{option_value(arg)};
        } else if (arg == "-t") {
            request.time_limit = seconds_value(arg);
        } else if (arg == "-c") {
            request.compile_time_limit = seconds_value(arg);
        } else if (arg == "-v") {
            request.verbose = true;
        } else if (arg == "-h" or arg == "--help") {
            print_usage(stdout, program_name);
            std::exit(EXIT_SUCCESS);
        } else {
            usage_error(program_name, "unknown option: '", arg, '\'');
        }
    }

    if (positional.size() != 3) {
        usage_error(program_name, "expected 3 arguments: source input output");
    }
    request.source = positional[0];
    request.input = positional[1];
    request.expected_output = positional[2];
    return request;
}

int emit(const Verdict& verdict) {
    auto json = verdict.to_json();
    (void)fwrite(json.data(), 1, json.size(), stdout);
    if (fflush(stdout)) {
        return EXIT_FAILURE;
    }
    return verdict.exit_status;
}

} // namespace

int main(int argc, char** argv) {
    JudgeRequest request = parse_arguments(argc, argv);
    try {
        return emit(runjudge::judge::judge(request, stdlog));
    } catch (const std::exception& e) {
        errlog("Error: ", e.what());
        return emit(Verdict{
            .result = "Execution Error",
            .exit_status = EXIT_FAILURE,
            .score = Verdict::Score::ExecutionError,
        });
    }
}
