#pragma once

#include "../errors.hpp"
#include "../system_info.hpp"
#include <vector>

namespace systop {

class ISampler {
public:
    virtual ~ISampler() = default;

    // Full snapshot of the host. Throws SamplingError when nothing usable
    // could be read.
    virtual RawSystemSample sample() = 0;

    virtual std::vector<ParseError> get_recent_errors() = 0;
};

} // namespace systop
