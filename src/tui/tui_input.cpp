#include "tui_app.hpp"
#include "tui_colors.hpp"

namespace systop {

namespace {

constexpr int kCtrlC = 3;

} // namespace

Command TuiApp::command_for_key(int ch) {
    Command cmd;
    switch (ch) {
        case 'q':
        case kCtrlC:
            cmd.type = CommandType::Quit;
            break;

        case KEY_UP:
        case 'k':
            cmd.type = CommandType::NavigateUp;
            break;

        case KEY_DOWN:
        case 'j':
            cmd.type = CommandType::NavigateDown;
            break;

        case 'K':
            cmd.type = CommandType::KillSelected;
            break;

        case 'c':
            cmd.type = CommandType::SetSort;
            cmd.sort_key = SortKey::Cpu;
            break;

        case 'm':
            cmd.type = CommandType::SetSort;
            cmd.sort_key = SortKey::Memory;
            break;

        case 'p':
            cmd.type = CommandType::SetSort;
            cmd.sort_key = SortKey::Pid;
            break;

        case 'n':
            cmd.type = CommandType::SetSort;
            cmd.sort_key = SortKey::Name;
            break;

        default:
            break;
    }
    return cmd;
}

void TuiApp::handle_input(int ch) {
    // Help overlay takes priority
    if (show_help_) {
        handle_help_input(ch);
        return;
    }

    // Keys that only concern the UI
    switch (ch) {
        case '?':
        case KEY_F(1):
            show_help_ = true;
            flushinp();  // Clear any pending input
            return;

        case 'r':
        case KEY_F(5):
            refresher_->refresh_now();
            return;

        case KEY_RESIZE:
            resize_windows();
            return;

        default:
            break;
    }

    Command cmd = command_for_key(ch);
    if (cmd.type == CommandType::None) return;

    controller_.handle(cmd);
    if (cmd.type == CommandType::SetSort) {
        process_scroll_offset_ = 0;
    }
    scroll_to_selection();
}

void TuiApp::handle_help_input(int ch) {
    // Close help on specific keys only (not on escape sequences)
    switch (ch) {
        case 27:        // Escape
        case 'q':
        case '\n':
        case '\r':
        case ' ':
        case '?':
        case KEY_F(1):
            show_help_ = false;
            break;

        // Ctrl-C still quits from the overlay
        case kCtrlC:
            show_help_ = false;
            controller_.handle(command_for_key(ch));
            break;

        // Ignore other keys (escape sequence bytes, etc.)
        default:
            break;
    }
}

} // namespace systop
