#include "linux_process_killer.hpp"
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstring>
#include <fmt/format.h>

namespace systop {

std::string LinuxProcessKiller::get_kill_error_message(int err) {
    switch (err) {
        case EPERM:
            return "Permission denied. You may need root privileges or CAP_KILL capability to signal this process.";
        case ESRCH:
            return "Process not found. It may have already terminated.";
        case EINVAL:
            return "Invalid signal.";
        default:
            return fmt::format("Failed to send signal: {} (errno {})", strerror(err), err);
    }
}

KillResult LinuxProcessKiller::kill_process(uint32_t pid, bool force) {
    KillResult result;

    // pid 0 and anything that wraps negative would signal a whole group
    if (pid == 0 || pid > static_cast<uint32_t>(INT_MAX)) {
        result.success = false;
        result.error_message = "Invalid PID";
        return result;
    }

    const int signal = force ? SIGKILL : SIGTERM;
    if (kill(static_cast<pid_t>(pid), signal) == -1) {
        const int err = errno;
        result.success = false;
        result.error_message = get_kill_error_message(err);
        result.process_still_running = (err != ESRCH);
        return result;
    }

    result.success = true;
    result.process_still_running = !force && kill(static_cast<pid_t>(pid), 0) == 0;
    return result;
}

} // namespace systop
