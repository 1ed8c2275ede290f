#include "interaction_controller.hpp"
#include <cassert>
#include <spdlog/spdlog.h>

namespace systop {

InteractionController::InteractionController(const SnapshotStore* store, IProcessKiller* killer)
    : store_(store)
    , killer_(killer)
{
    assert(store_ != nullptr);
    assert(killer_ != nullptr);
}

void InteractionController::handle(const Command& command) {
    switch (command.type) {
        case CommandType::Quit:
            should_quit_ = true;
            break;

        case CommandType::NavigateUp:
            selection_.move_up();
            break;

        case CommandType::NavigateDown:
            selection_.move_down(store_->process_count());
            break;

        case CommandType::SetSort:
            set_sort(command.sort_key);
            break;

        case CommandType::KillSelected:
            kill_selected();
            break;

        case CommandType::None:
            break;
    }
}

std::vector<ProcessSample> InteractionController::visible_processes() {
    auto processes = store_->processes(sort_key_);
    selection_.clamp(processes.size());
    return processes;
}

void InteractionController::set_sort(SortKey key) {
    sort_key_ = key;
    // Positions mean nothing across orderings, so start from the top
    selection_.reset();
    spdlog::debug("Sorting by {}", sort_key_name(key));
}

void InteractionController::kill_selected() {
    const auto processes = store_->processes(sort_key_);
    const size_t index = selection_.cursor();
    if (index >= processes.size()) {
        return;
    }

    const auto& target = processes[index];
    // The outcome is not reported to the user
    KillResult result = killer_->kill_process(target.pid, true);
    if (result.success) {
        spdlog::info("Sent SIGKILL to {} (PID {})", target.name, target.pid);
    } else {
        spdlog::info("Kill of {} (PID {}) failed: {}", target.name, target.pid, result.error_message);
    }
}

} // namespace systop
