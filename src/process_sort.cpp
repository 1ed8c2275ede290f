#include "process_sort.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace systop {

// NaN has no place in a strict weak ordering, so it is mapped to the
// lowest rank instead of being compared.
static bool cpu_greater(const ProcessSample& a, const ProcessSample& b) {
    const bool a_nan = std::isnan(a.cpu_usage);
    const bool b_nan = std::isnan(b.cpu_usage);
    if (a_nan || b_nan) {
        return !a_nan && b_nan;
    }
    return a.cpu_usage > b.cpu_usage;
}

// Case folding covers ASCII only. Bytes of multibyte names compare raw.
static bool name_less(const ProcessSample& a, const ProcessSample& b) {
    return std::ranges::lexicographical_compare(a.name, b.name, [](unsigned char x, unsigned char y) {
        return std::tolower(x) < std::tolower(y);
    });
}

void sort_processes(std::vector<ProcessSample>& processes, SortKey key) {
    switch (key) {
        case SortKey::Cpu:
            std::ranges::stable_sort(processes, cpu_greater);
            break;
        case SortKey::Memory:
            std::ranges::stable_sort(processes, [](const ProcessSample& a, const ProcessSample& b) {
                return a.memory_bytes > b.memory_bytes;
            });
            break;
        case SortKey::Pid:
            std::ranges::stable_sort(processes, {}, &ProcessSample::pid);
            break;
        case SortKey::Name:
            std::ranges::stable_sort(processes, name_less);
            break;
    }
}

std::string_view sort_key_name(SortKey key) {
    switch (key) {
        case SortKey::Cpu: return "CPU";
        case SortKey::Memory: return "Memory";
        case SortKey::Pid: return "PID";
        case SortKey::Name: return "Name";
    }
    return "?";
}

} // namespace systop
