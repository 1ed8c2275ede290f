#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>

namespace systop {

namespace {

struct Column {
    const char* title;
    int width;
    SortKey key;
    bool left_aligned;
};

// Name takes whatever width the other columns leave
constexpr Column kColumns[] = {
    {"PID", 7, SortKey::Pid, false},
    {"Name", 0, SortKey::Name, true},
    {"CPU%", 7, SortKey::Cpu, false},
    {"Memory", 9, SortKey::Memory, false},
    {"Mem%", 6, SortKey::Memory, false},
};

constexpr int kMinNameWidth = 12;
constexpr int kMaxNameWidth = 40;

int name_column_width(int inner_width) {
    int fixed = 0;
    for (const auto& col : kColumns) {
        fixed += col.width + 1;
    }
    return std::clamp(inner_width - fixed - 1, kMinNameWidth, kMaxNameWidth);
}

} // namespace

void TuiApp::render_process_list() {
    if (!process_win_) return;

    int max_y, max_x;
    getmaxyx(process_win_, max_y, max_x);

    std::string title = "Processes (" + std::to_string(view_.processes.size()) + ") sorted by "
                        + std::string(sort_key_name(controller_.sort_key()));
    draw_box_title(process_win_, title);

    int name_width = name_column_width(max_x - 2);

    // Column headers; the active sort column is highlighted
    int x = 2;
    wattron(process_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    mvwhline(process_win_, 1, 1, ' ', max_x - 2);
    wattroff(process_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    for (const auto& col : kColumns) {
        int width = col.width ? col.width : name_width;
        bool active = col.key == controller_.sort_key();
        int attr = COLOR_PAIR(active ? COLOR_PAIR_HEADER_ACTIVE : COLOR_PAIR_HEADER) | A_BOLD;
        if (active) attr |= A_UNDERLINE;

        wattron(process_win_, attr);
        if (col.left_aligned) {
            mvwprintw(process_win_, 1, x, "%-*s", width, col.title);
        } else {
            mvwprintw(process_win_, 1, x, "%*s", width, col.title);
        }
        wattroff(process_win_, attr);
        x += width + 1;
    }

    int available_rows = max_y - 3;  // Account for border and header
    visible_process_rows_ = available_rows;
    scroll_to_selection();

    const size_t cursor = controller_.cursor();
    int row = 2;
    for (size_t i = static_cast<size_t>(process_scroll_offset_);
         i < view_.processes.size() && row < max_y - 1;
         ++i, ++row) {

        const auto& proc = view_.processes[i];
        bool is_selected = (i == cursor);

        if (is_selected) {
            wattron(process_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
            mvwhline(process_win_, row, 1, ' ', max_x - 2);
        }

        std::string name = proc.name;
        if (static_cast<int>(name.length()) > name_width) {
            name = name.substr(0, name_width - 3) + "...";
        }

        mvwprintw(process_win_, row, 2, "%7u %-*s %6.1f%% %9s %5.1f%%",
                  proc.pid,
                  name_width, name.c_str(),
                  static_cast<double>(proc.cpu_usage),
                  format_bytes(proc.memory_bytes).c_str(),
                  proc.memory_percent);

        if (is_selected) {
            wattroff(process_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
        }
    }

    if (view_.processes.empty()) {
        wattron(process_win_, A_DIM);
        mvwprintw(process_win_, 2, 2, "No processes");
        wattroff(process_win_, A_DIM);
    }
}

} // namespace systop
