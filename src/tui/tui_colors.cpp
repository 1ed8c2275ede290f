#include "tui_colors.hpp"

namespace systop {

void init_colors() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    // Basic colors
    init_pair(COLOR_PAIR_DEFAULT, -1, -1);  // Default terminal colors
    init_pair(COLOR_PAIR_TITLE, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN);
    init_pair(COLOR_PAIR_HEADER, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_HEADER_ACTIVE, COLOR_YELLOW, COLOR_BLUE);
    init_pair(COLOR_PAIR_BORDER, COLOR_BLUE, -1);
    init_pair(COLOR_PAIR_HOST, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_UPTIME, COLOR_YELLOW, -1);

    // Gauges and history
    init_pair(COLOR_PAIR_GAUGE_LOW, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_GAUGE_MID, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_GAUGE_HIGH, COLOR_RED, -1);
    init_pair(COLOR_PAIR_SPARKLINE, COLOR_CYAN, -1);

    // Status
    init_pair(COLOR_PAIR_STATUS, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_ERROR, COLOR_RED, -1);

    // Help
    init_pair(COLOR_PAIR_DIALOG, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_HELP_KEY, COLOR_CYAN, COLOR_BLUE);
}

int get_cpu_gauge_color(double percent) {
    if (percent <= 50.0) return COLOR_PAIR_GAUGE_LOW;
    if (percent <= 80.0) return COLOR_PAIR_GAUGE_MID;
    return COLOR_PAIR_GAUGE_HIGH;
}

int get_memory_gauge_color(double percent) {
    if (percent <= 60.0) return COLOR_PAIR_GAUGE_LOW;
    if (percent <= 85.0) return COLOR_PAIR_GAUGE_MID;
    return COLOR_PAIR_GAUGE_HIGH;
}

} // namespace systop
