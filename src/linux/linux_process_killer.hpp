#pragma once

#include "../interfaces/i_process_killer.hpp"

namespace systop {

class LinuxProcessKiller : public IProcessKiller {
public:
    LinuxProcessKiller() = default;
    ~LinuxProcessKiller() override = default;

    KillResult kill_process(uint32_t pid, bool force) override;

private:
    static std::string get_kill_error_message(int err);
};

} // namespace systop
