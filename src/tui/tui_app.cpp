#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <array>
#include <cassert>
#include <cmath>
#include <csignal>
#include <fmt/format.h>

namespace systop {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiApp::TuiApp(const SnapshotStore* store,
               Refresher* refresher,
               ISampler* sampler,
               IProcessKiller* killer,
               bool debug_mode)
    : store_(store)
    , refresher_(refresher)
    , sampler_(sampler)
    , controller_(store, killer)
    , debug_mode_(debug_mode)
{
    assert(store_ != nullptr);
    assert(refresher_ != nullptr);
    assert(sampler_ != nullptr);
}

TuiApp::~TuiApp() {
    cleanup_windows();
}

void TuiApp::run() {
    // Raw mode: Ctrl-C arrives as a key instead of SIGINT
    initscr();
    raw();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    timeout(kInputPollMs);

    init_colors();

    signal(SIGWINCH, handle_resize);

    view_ = store_->view(controller_.sort_key());
    create_windows();

    running_ = true;
    while (running_) {
        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
            resize_windows();
        }

        // One consistent copy of the store per frame
        view_ = store_->view(controller_.sort_key());
        controller_.clamp_selection(view_.processes.size());

        render();

        // Blocks for at most kInputPollMs
        int ch = getch();
        if (ch != ERR) {
            handle_input(ch);
        }

        if (controller_.should_quit()) {
            running_ = false;
        }
    }

    cleanup_windows();
    endwin();
}

int TuiApp::calc_cpus_per_row(int width) const {
    return std::max(1, (width - 2) / kCpuCellWidth);
}

int TuiApp::calc_system_panel_height() const {
    int max_x = getmaxx(stdscr);

    size_t num_cpus = std::max<size_t>(view_.cpus.size(), 1);
    int cpus_per_row = calc_cpus_per_row(max_x);
    int cpu_rows = static_cast<int>((num_cpus + cpus_per_row - 1) / cpus_per_row);
    cpu_rows = std::min(cpu_rows, kMaxCpuRows);

    return cpu_rows + 2 + 2;  // memory gauge + memory history + border
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    int system_height = calc_system_panel_height();
    int process_height = std::max(4, max_y - kHeaderHeight - system_height - kStatusBarHeight);

    int y = 0;
    header_win_ = newwin(kHeaderHeight, max_x, y, 0);
    y += kHeaderHeight;

    system_win_ = newwin(system_height, max_x, y, 0);
    y += system_height;

    process_win_ = newwin(process_height, max_x, y, 0);
    y += process_height;
    visible_process_rows_ = process_height - 3;  // border and column header

    status_win_ = newwin(kStatusBarHeight, max_x, y, 0);
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
    scroll_to_selection();
}

void TuiApp::cleanup_windows() {
    for (WINDOW** win : {&header_win_, &system_win_, &process_win_, &status_win_}) {
        if (*win) {
            delwin(*win);
            *win = nullptr;
        }
    }
}

void TuiApp::render() {
    werase(header_win_);
    werase(system_win_);
    werase(process_win_);
    werase(status_win_);

    render_header();
    render_system_panel();
    render_process_list();
    render_status_bar();

    wnoutrefresh(header_win_);
    wnoutrefresh(system_win_);
    wnoutrefresh(process_win_);
    wnoutrefresh(status_win_);
    doupdate();

    if (show_help_) {
        render_help_overlay();
    }
}

void TuiApp::render_header() {
    if (!header_win_) return;

    const auto& host = view_.host;
    draw_box_title(header_win_, "SysTop - System Monitor");

    int x = 2;
    auto field = [&](const char* name, const std::string& value, int color) {
        mvwprintw(header_win_, 1, x, "%s: ", name);
        x += static_cast<int>(std::string(name).size()) + 2;
        wattron(header_win_, COLOR_PAIR(color) | A_BOLD);
        mvwprintw(header_win_, 1, x, "%s", value.c_str());
        wattroff(header_win_, COLOR_PAIR(color) | A_BOLD);
        x += static_cast<int>(value.size()) + 3;
    };

    field("Host", host.hostname, COLOR_PAIR_HOST);
    field("OS", host.os_version, COLOR_PAIR_DEFAULT);
    field("Kernel", host.kernel_version, COLOR_PAIR_DEFAULT);
    field("Uptime", format_uptime(host.uptime_seconds), COLOR_PAIR_UPTIME);
}

void TuiApp::draw_box_title(WINDOW* win, const std::string& title) {
    wattron(win, COLOR_PAIR(COLOR_PAIR_BORDER));
    box(win, 0, 0);
    wattroff(win, COLOR_PAIR(COLOR_PAIR_BORDER));
    if (!title.empty()) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
        mvwprintw(win, 0, 2, " %s ", title.c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    }
}

void TuiApp::draw_progress_bar(WINDOW* win, int y, int x, int width,
                               double percent, int color_pair, const std::string& label) {
    if (width < 3) return;

    if (std::isnan(percent)) percent = 0.0;
    int bar_width = width - 2;  // Account for brackets
    int filled = static_cast<int>(bar_width * std::clamp(percent, 0.0, 100.0) / 100.0);

    mvwaddch(win, y, x, '[');

    wattron(win, COLOR_PAIR(color_pair));
    for (int i = 0; i < filled; ++i) {
        waddch(win, ACS_CKBOARD);
    }
    wattroff(win, COLOR_PAIR(color_pair));

    for (int i = filled; i < bar_width; ++i) {
        waddch(win, ' ');
    }
    waddch(win, ']');

    if (!label.empty()) {
        mvwprintw(win, y, x + width + 1, "%s", label.c_str());
    }
}

// Newest sample at the right edge; percentages map onto ten glyph levels
std::string TuiApp::sparkline(const std::vector<double>& values, size_t width) {
    static constexpr char kLevels[] = " .:-=+*#%@";
    static constexpr int kTopLevel = sizeof(kLevels) - 2;

    size_t count = std::min(values.size(), width);
    std::string line(width - count, ' ');
    for (size_t i = values.size() - count; i < values.size(); ++i) {
        double v = values[i];
        if (std::isnan(v)) {
            line += ' ';
            continue;
        }
        int level = static_cast<int>(std::lround(std::clamp(v, 0.0, 100.0) / 100.0 * kTopLevel));
        line += kLevels[level];
    }
    return line;
}

// Binary units with three significant digits: 512B, 1.50K, 12.3M, 256G
std::string TuiApp::format_bytes(uint64_t bytes) {
    static constexpr std::array<char, 6> kUnits = {'B', 'K', 'M', 'G', 'T', 'P'};
    if (bytes < 1024) {
        return fmt::format("{}B", bytes);
    }

    size_t unit = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024.0 && unit + 1 < kUnits.size()) {
        size /= 1024.0;
        ++unit;
    }

    const int precision = size >= 100.0 ? 0 : (size >= 10.0 ? 1 : 2);
    return fmt::format("{:.{}f}{}", size, precision, kUnits[unit]);
}

std::string TuiApp::format_uptime(uint64_t seconds) {
    return fmt::format("{}h {}m", seconds / 3600, (seconds % 3600) / 60);
}

void TuiApp::scroll_to_selection() {
    int selected_idx = static_cast<int>(controller_.cursor());
    int rows = std::max(1, visible_process_rows_);

    if (selected_idx < process_scroll_offset_) {
        process_scroll_offset_ = selected_idx;
    } else if (selected_idx >= process_scroll_offset_ + rows) {
        process_scroll_offset_ = selected_idx - rows + 1;
    }
}

} // namespace systop
