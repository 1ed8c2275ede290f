#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>

namespace systop {

void TuiApp::render_help_overlay() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    const char* help_lines[] = {
        "Navigation:",
        "  Up/k, Down/j    Move selection up/down",
        "",
        "Sorting:",
        "  c               Sort by CPU usage",
        "  m               Sort by memory usage",
        "  p               Sort by PID",
        "  n               Sort by name",
        "",
        "Actions:",
        "  K               Kill selected process (SIGKILL)",
        "  r/F5            Refresh now",
        "  q/Ctrl-C        Quit",
        "  ?/F1            This help",
    };
    constexpr int kLineCount = static_cast<int>(sizeof(help_lines) / sizeof(help_lines[0]));

    int help_width = std::min(56, max_x);
    int help_height = std::min(kLineCount + 5, max_y);
    int help_x = (max_x - help_width) / 2;
    int help_y = (max_y - help_height) / 2;

    WINDOW* help_win = newwin(help_height, help_width, help_y, help_x);
    if (!help_win) return;

    wbkgd(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(help_win, 0, 0);

    wattron(help_win, A_BOLD);
    mvwprintw(help_win, 0, (help_width - 6) / 2, " Help ");
    wattroff(help_win, A_BOLD);

    int row = 2;
    for (const char* line : help_lines) {
        if (row >= help_height - 2) break;

        if (line[0] == ' ' && line[1] == ' ') {
            // Key binding line
            std::string key(line, 2, 16);
            std::string desc(line + 18);

            wattron(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 2, "%s", key.c_str());
            wattroff(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 18, "%s", desc.c_str());
        } else {
            wattron(help_win, A_BOLD);
            mvwprintw(help_win, row, 2, "%s", line);
            wattroff(help_win, A_BOLD);
        }
        row++;
    }

    wattron(help_win, A_REVERSE);
    mvwprintw(help_win, help_height - 2, (help_width - 24) / 2, " Press ? or Esc to close ");
    wattroff(help_win, A_REVERSE);

    wrefresh(help_win);
    delwin(help_win);
}

void TuiApp::render_status_bar() {
    if (!status_win_) return;

    int max_x = getmaxx(status_win_);

    wbkgd(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));
    werase(status_win_);

    // Left side: key hints
    const char* hints = "q:Quit  j/k:Move  c/m/p/n:Sort  K:Kill  r:Refresh  ?:Help";
    mvwprintw(status_win_, 0, 1, "%s", hints);
    int left_end = 1 + static_cast<int>(std::string(hints).size()) + 2;

    // Right side: markers, then the latest sampler error in the space between
    std::string markers;
    if (refresher_->is_stale()) markers += "[STALE] ";
    if (debug_mode_) markers += "[DEBUG MODE ACTIVE] ";

    int markers_x = max_x - static_cast<int>(markers.size()) - 1;
    if (!markers.empty() && markers_x > left_end) {
        wattron(status_win_, A_BOLD);
        mvwprintw(status_win_, 0, markers_x, "%s", markers.c_str());
        wattroff(status_win_, A_BOLD);
    } else {
        markers_x = max_x;
    }

    auto errors = sampler_->get_recent_errors();
    int room = markers_x - left_end - 1;
    if (!errors.empty() && room > 8) {
        std::string message = errors.back().message;
        if (static_cast<int>(message.length()) > room) {
            message = message.substr(0, room - 3) + "...";
        }
        wattron(status_win_, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        mvwprintw(status_win_, 0, left_end, "%s", message.c_str());
        wattroff(status_win_, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
    }
}

} // namespace systop
