#include "prlctl/vm_types.hpp"
#include <algorithm>
#include <cctype>

std::string vmStatusToString(VmStatus status) {
    switch (status) {
        case VmStatus::Running:   return "running";
        case VmStatus::Stopped:   return "stopped";
        case VmStatus::Suspended: return "suspended";
        case VmStatus::Paused:    return "paused";
        default:                  return "unknown";
    }
}

VmStatus parseVmStatus(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "running") return VmStatus::Running;
    if (lower == "stopped") return VmStatus::Stopped;
    if (lower == "suspended") return VmStatus::Suspended;
    if (lower == "paused") return VmStatus::Paused;
    return VmStatus::Unknown;
}
