#pragma once

#include "process_info.hpp"
#include <string_view>
#include <vector>

namespace systop {

enum class SortKey {
    Cpu,        // descending cpu_usage
    Memory,     // descending memory_bytes
    Pid,        // ascending pid
    Name        // ascending, case-insensitive
};

// Stable sort in place. NaN CPU values sort after every number.
void sort_processes(std::vector<ProcessSample>& processes, SortKey key);

[[nodiscard]] std::string_view sort_key_name(SortKey key);

} // namespace systop
