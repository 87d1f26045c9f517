#pragma once

#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

namespace syscalls {

#ifdef SYS_pidfd_open
inline int pidfd_open(pid_t pid, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}
#endif

} // namespace syscalls
