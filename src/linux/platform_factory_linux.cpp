#include "../platform_factory.hpp"

#include "linux_sampler.hpp"
#include "linux_process_killer.hpp"

namespace systop {

std::unique_ptr<ISampler> make_sampler() {
    return std::make_unique<LinuxSampler>();
}

std::unique_ptr<IProcessKiller> make_process_killer() {
    return std::make_unique<LinuxProcessKiller>();
}

} // namespace systop
