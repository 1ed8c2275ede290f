#pragma once

#include <cstdint>
#include <string>

namespace systop {

struct KillResult {
    bool success = false;
    bool process_still_running = false;
    std::string error_message;
};

class IProcessKiller {
public:
    virtual ~IProcessKiller() = default;

    // force selects SIGKILL instead of SIGTERM
    virtual KillResult kill_process(uint32_t pid, bool force) = 0;
};

} // namespace systop
