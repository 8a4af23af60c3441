#pragma once

#include "prlctl/vm_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace prlctl {

// Parses `prlctl list --all` output:
//
//   UUID                                     STATUS       IP_ADDR         NAME
//   {11111111-1111-1111-1111-111111111111} running      10.211.55.3     Ubuntu Server
//
// The header line is optional. Lines that do not start with a braced token
// followed by a status are skipped. Everything after the IP column is the
// name, inner spacing included.
std::vector<VmRecord> parseVmList(const std::string& output);

// Parses `prlctl snapshot-list` output:
//
//   {22222222-2222-2222-2222-222222222222} * "Current State" 2024-01-15 11:00:00
//
// `*` marks the current snapshot. Only the first marked line is reported as
// current. Unparsable lines are skipped.
std::vector<SnapshotRecord> parseSnapshotList(const std::string& output);

// Looks a VM up by exact name or UUID.
std::optional<VmRecord> findVm(const std::vector<VmRecord>& vms, const std::string& nameOrUuid);

} // namespace prlctl
