#pragma once

#include <optional>
#include <string>

enum class VmStatus {
    Running,
    Stopped,
    Suspended,
    Paused,
    Unknown
};

struct VmRecord {
    std::string uuid;
    VmStatus status{VmStatus::Unknown};
    std::string statusText;                 // raw STATUS column, e.g. "starting"
    std::optional<std::string> ipAddress;   // absent when prlctl prints "-"
    std::string name;
};

struct SnapshotRecord {
    std::string id;
    std::string name;
    std::string date;
    bool current{false};
};

std::string vmStatusToString(VmStatus status);
VmStatus parseVmStatus(const std::string& text);
