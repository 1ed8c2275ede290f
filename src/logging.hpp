#pragma once

#include "options.hpp"

namespace systop {

// Install the default spdlog logger. ncurses owns the terminal, so logs go
// to a file when one is configured and nowhere otherwise.
void init_logging(const Options& options);

} // namespace systop
