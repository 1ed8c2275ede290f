#pragma once

#include "interfaces/i_sampler.hpp"
#include "interfaces/i_process_killer.hpp"
#include <memory>

namespace systop {

// Factory functions to create platform-specific collaborators.
// Implemented per-platform; current build provides Linux implementations.
std::unique_ptr<ISampler> make_sampler();
std::unique_ptr<IProcessKiller> make_process_killer();

} // namespace systop
