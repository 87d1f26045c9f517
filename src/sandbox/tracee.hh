#pragma once

#include <runjudge/file_descriptor.hh>
#include <runjudge/sandbox/sandbox.hh>

namespace runjudge::sandbox::tracee {

// Runs in the forked child: prepares the process and executes options.args. On failure, the
// error description is written to @p error_fd and the process exits.
[[noreturn]] void
execute(const Options& options, FileDescriptor error_fd, pid_t parent_pid) noexcept;

} // namespace runjudge::sandbox::tracee
