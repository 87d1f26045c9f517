#pragma once

#include <chrono>
#include <runjudge/file_descriptor.hh>
#include <runjudge/sandbox/sandbox.hh>

namespace runjudge::sandbox::supervisor {

// Supervises the already forked child @p pid until it dies or reaches the time limit, then
// kills its process group and reaps it. @p error_fd is the read end of the pipe through which
// the child reports a failure to start.
Result supervise(
    const Options& options,
    pid_t pid,
    FileDescriptor error_fd,
    std::chrono::steady_clock::time_point start_time
);

} // namespace runjudge::sandbox::supervisor
