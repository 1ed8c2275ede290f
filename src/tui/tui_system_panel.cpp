#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace systop {

void TuiApp::render_system_panel() {
    if (!system_win_) return;

    int max_y, max_x;
    getmaxyx(system_win_, max_y, max_x);

    std::ostringstream title;
    title << "CPU (" << view_.cpus.size() << ") / Memory";
    draw_box_title(system_win_, title.str());

    int cpus_per_row = calc_cpus_per_row(max_x);
    int cell_width = (max_x - 2) / cpus_per_row;
    int cpu_rows = max_y - 4;  // border + two memory rows

    // Cores that do not fit are left out; the title still shows the count
    for (size_t i = 0; i < view_.cpus.size(); ++i) {
        int row = static_cast<int>(i) / cpus_per_row;
        if (row >= cpu_rows) break;
        int col = static_cast<int>(i) % cpus_per_row;
        render_cpu_cell(1 + row, 1 + col * cell_width, cell_width, view_.cpus[i]);
    }

    render_memory_rows(max_y - 3);
}

void TuiApp::render_cpu_cell(int y, int x, int width, const CpuSeries& cpu) {
    // "cpu12 [gauge] 100.0% sparkline"
    std::string label = cpu.label.substr(0, 6);
    mvwprintw(system_win_, y, x + 1, "%-6s", label.c_str());

    int gauge_x = x + 8;
    double usage = cpu.current_usage;
    draw_progress_bar(system_win_, y, gauge_x, kGaugeWidth, usage, get_cpu_gauge_color(usage));

    std::ostringstream pct;
    pct << std::fixed << std::setprecision(1) << std::setw(5) << usage << "%";
    mvwprintw(system_win_, y, gauge_x + kGaugeWidth + 1, "%s", pct.str().c_str());

    int spark_x = gauge_x + kGaugeWidth + 9;
    int spark_width = x + width - spark_x - 1;
    if (spark_width <= 0) return;

    auto history = cpu.history.values();
    std::vector<double> points(history.begin(), history.end());
    wattron(system_win_, COLOR_PAIR(COLOR_PAIR_SPARKLINE));
    mvwprintw(system_win_, y, spark_x, "%s", sparkline(points, static_cast<size_t>(spark_width)).c_str());
    wattroff(system_win_, COLOR_PAIR(COLOR_PAIR_SPARKLINE));
}

void TuiApp::render_memory_rows(int y) {
    int max_x = getmaxx(system_win_);
    double mem_pct = view_.memory_percent;

    std::ostringstream mem_label;
    mem_label << format_bytes(view_.used_memory) << "/" << format_bytes(view_.total_memory)
              << " (" << std::fixed << std::setprecision(1) << mem_pct << "%)";

    mvwprintw(system_win_, y, 2, "Mem");
    int gauge_width = std::clamp(max_x - 40, kGaugeWidth, 60);
    draw_progress_bar(system_win_, y, 9, gauge_width, mem_pct,
                      get_memory_gauge_color(mem_pct), mem_label.str());

    // Memory history spans the panel
    mvwprintw(system_win_, y + 1, 2, "Hist");
    int spark_width = max_x - 11;
    if (spark_width <= 0) return;

    wattron(system_win_, COLOR_PAIR(COLOR_PAIR_SPARKLINE));
    mvwprintw(system_win_, y + 1, 9, "%s",
              sparkline(view_.memory.history.values(), static_cast<size_t>(spark_width)).c_str());
    wattroff(system_win_, COLOR_PAIR(COLOR_PAIR_SPARKLINE));
}

} // namespace systop
