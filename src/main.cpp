#include "errors.hpp"
#include "logging.hpp"
#include "options.hpp"
#include "platform_factory.hpp"
#include "refresher.hpp"
#include "snapshot_store.hpp"
#include "tui/tui_app.hpp"
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "systop";

    systop::Options options;
    try {
        options = systop::parse_options(argc, argv);
    } catch (const systop::OptionsError& e) {
        std::cerr << program << ": " << e.what() << "\n\n" << systop::usage(program);
        return 2;
    }

    if (options.show_help) {
        std::cout << systop::usage(program);
        return 0;
    }
    if (options.show_version) {
        std::cout << "systop " << systop::kVersion << std::endl;
        return 0;
    }

    try {
        systop::init_logging(options);

        // Platform collaborators are owned here in main
        auto sampler = systop::make_sampler();
        auto killer = systop::make_process_killer();

        systop::SnapshotStore store;
        systop::Refresher refresher(sampler.get(), &store, options.refresh_interval);

        // First sample before ncurses takes the terminal; a failure exits here
        refresher.start();

        systop::TuiApp app(&store, &refresher, sampler.get(), killer.get(), options.debug);
        app.run();

        refresher.stop();
        spdlog::info("systop exiting");
        return 0;
    } catch (const std::exception& e) {
        // Make sure we restore terminal state before printing error
        if (!isendwin()) {
            endwin();
        }
        spdlog::error("Fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
