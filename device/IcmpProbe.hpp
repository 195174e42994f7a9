#pragma once

#include <cstdint>
#include <mutex>
#include "ReachabilityProbe.hpp"

namespace switch_watch::device
{
    // ICMP echo via libtins. Needs raw-socket privileges; without them every
    // probe reports the host as silent.
    class IcmpProbe : public ReachabilityProbe
    {
    public:
        std::optional<double> Probe(const std::string &host, std::chrono::milliseconds timeout) override;

    private:
        std::mutex m_mutex;
        std::uint16_t m_sequence = 0;
    };
}
