#pragma once

#include <string>
#include <vector>
#include "Types.hpp"

namespace switch_watch::common
{
    // Turns one raw page (or its canonical text rendering) into one typed fragment.
    // Every entry point is pure and never throws; unrecognized input yields a
    // fully defaulted fragment with quality == ParseQuality::Defaulted.
    class ResponseParser
    {
    public:
        // info_ds array literal -> info_ds object literal -> "key : value" lines.
        static SystemInfo ParseSystemInfo(const std::string &text);

        // all_info script block -> pipe-delimited table.
        static PortTable ParsePortTable(const std::string &text);

        // 802.1Q block (tagMbrs/untagMbrs) -> port-based block (mbrs) -> legacy table -> default.
        static VlanConfig ParseVlanConfig(const std::string &text);
        static VlanConfig ParseStructuredVlans(const std::string &text);
        static VlanConfig ParsePortBasedVlans(const std::string &text);
        static VlanConfig ParseLegacyVlans(const std::string &text);

        static CableDiagnostics ParseCableDiagnostics(const std::string &text);

        // "1-4,7" -> {1,2,3,4,7}; sorted, deduplicated, ports outside [1, 48] dropped.
        static std::vector<int> ParsePortRange(const std::string &range);

        static bool IsStructuredVlanPayload(const std::string &text);
        static bool IsPortBasedVlanPayload(const std::string &text);

        static DiagnosticState DescribeCableState(int portNumber, int stateCode, int lengthMeters);
        static VlanConfig DefaultVlanConfig();
    };
}
