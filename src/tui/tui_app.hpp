#pragma once

#include "../interaction_controller.hpp"
#include "../interfaces/i_process_killer.hpp"
#include "../interfaces/i_sampler.hpp"
#include "../refresher.hpp"
#include "../snapshot_store.hpp"
#include <atomic>
#include <string>
#include <vector>
#include <ncurses.h>

namespace systop {

class TuiApp {
public:
    // Non-owning constructor: TuiApp uses but does not own the data layer.
    // All pointers must be non-null and must outlive the TuiApp instance.
    TuiApp(const SnapshotStore* store,
           Refresher* refresher,
           ISampler* sampler,
           IProcessKiller* killer,
           bool debug_mode);
    ~TuiApp();

    void run();

    // Key code to controller command; keys the controller does not know map to None
    static Command command_for_key(int ch);

private:
    // Rendering
    void render();
    void render_header();
    void render_system_panel();
    void render_cpu_cell(int y, int x, int width, const CpuSeries& cpu);
    void render_memory_rows(int y);
    void render_process_list();
    void render_status_bar();
    void render_help_overlay();

    // Input handling
    void handle_input(int ch);
    void handle_help_input(int ch);
    void scroll_to_selection();

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();
    [[nodiscard]] int calc_system_panel_height() const;
    [[nodiscard]] int calc_cpus_per_row(int width) const;

    // Utility
    static std::string format_bytes(uint64_t bytes);
    static std::string format_uptime(uint64_t seconds);
    static std::string sparkline(const std::vector<double>& values, size_t width);
    void draw_progress_bar(WINDOW* win, int y, int x, int width,
                           double percent, int color_pair, const std::string& label = "");
    void draw_box_title(WINDOW* win, const std::string& title);

    // Non-owned references to data layer
    const SnapshotStore* store_ = nullptr;
    Refresher* refresher_ = nullptr;
    ISampler* sampler_ = nullptr;

    InteractionController controller_;

    // Snapshot rendered this frame
    StoreView view_;

    // ncurses windows
    WINDOW* header_win_ = nullptr;
    WINDOW* system_win_ = nullptr;
    WINDOW* process_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    // UI state
    bool debug_mode_ = false;
    bool show_help_ = false;
    std::atomic<bool> running_{false};

    // Scroll positions
    int process_scroll_offset_ = 0;
    int visible_process_rows_ = 0;

    // Layout constants
    static constexpr int kHeaderHeight = 3;
    static constexpr int kStatusBarHeight = 1;
    static constexpr int kMaxCpuRows = 8;
    static constexpr int kCpuCellWidth = 64;
    static constexpr int kGaugeWidth = 20;
    static constexpr int kInputPollMs = 50;
};

} // namespace systop
