#pragma once

#include "interfaces/i_process_killer.hpp"
#include "process_sort.hpp"
#include "selection_tracker.hpp"
#include "snapshot_store.hpp"
#include <vector>

namespace systop {

enum class CommandType {
    None,
    Quit,
    NavigateUp,
    NavigateDown,
    SetSort,
    KillSelected
};

struct Command {
    CommandType type = CommandType::None;
    SortKey sort_key = SortKey::Cpu;    // Only read for SetSort
};

// Applies user commands to the selection, the active sort key and the
// process killer. Lives on the UI thread; only the store is shared.
class InteractionController {
public:
    // Non-owning: store and killer must outlive the controller.
    InteractionController(const SnapshotStore* store, IProcessKiller* killer);

    void handle(const Command& command);

    // Current process view for the active sort key, with the cursor
    // clamped to its length
    [[nodiscard]] std::vector<ProcessSample> visible_processes();

    // Clamp against a view the caller already fetched
    void clamp_selection(size_t view_length) { selection_.clamp(view_length); }

    [[nodiscard]] SortKey sort_key() const { return sort_key_; }
    [[nodiscard]] size_t cursor() const { return selection_.cursor(); }
    [[nodiscard]] bool should_quit() const { return should_quit_; }

private:
    void set_sort(SortKey key);
    void kill_selected();

    const SnapshotStore* store_ = nullptr;
    IProcessKiller* killer_ = nullptr;

    SelectionTracker selection_;
    SortKey sort_key_ = SortKey::Cpu;
    bool should_quit_ = false;
};

} // namespace systop
