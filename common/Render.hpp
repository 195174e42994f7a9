#pragma once

#include <set>
#include <string>
#include <vector>
#include "Types.hpp"

namespace switch_watch::common
{
    // {1,2,3,4,7} -> "1-4,7"; empty input -> "".
    std::string FormatPortRanges(const std::set<int> &ports);
    std::string FormatPortRanges(const std::vector<int> &ports);

    // Canonical text forms, readable back by ResponseParser.
    std::string RenderSystemInfo(const SystemInfo &info);
    std::string RenderPortTable(const std::vector<PortState> &ports);
    std::string RenderVlanTable(const VlanConfig &config);
    std::string RenderCableTable(const std::vector<DiagnosticState> &diagnostics);

    // One-line values used in change events.
    std::string DescribePort(const PortState &port);
    std::string DescribeVlan(const VlanState &vlan);
    std::string DescribeDiagnostic(const DiagnosticState &diag);
}
