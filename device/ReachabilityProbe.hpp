#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace switch_watch::device
{
    // Network-level reachability, independent of the HTTP session.
    class ReachabilityProbe
    {
    public:
        virtual ~ReachabilityProbe() = default;

        // Round-trip time in milliseconds, or nullopt when the host stays silent.
        virtual std::optional<double> Probe(const std::string &host, std::chrono::milliseconds timeout) = 0;
    };
}
