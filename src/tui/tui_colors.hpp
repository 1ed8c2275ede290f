#pragma once

#include <ncurses.h>

namespace systop {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_HEADER,
    COLOR_PAIR_HEADER_ACTIVE,
    COLOR_PAIR_BORDER,
    COLOR_PAIR_HOST,
    COLOR_PAIR_UPTIME,
    COLOR_PAIR_GAUGE_LOW,
    COLOR_PAIR_GAUGE_MID,
    COLOR_PAIR_GAUGE_HIGH,
    COLOR_PAIR_SPARKLINE,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_DIALOG,
    COLOR_PAIR_HELP_KEY,
};

// Initialize ncurses color pairs
void init_colors();

// Gauge color for a CPU load percentage
int get_cpu_gauge_color(double percent);

// Gauge color for a memory usage percentage
int get_memory_gauge_color(double percent);

} // namespace systop
