#pragma once

#include <cstdint>
#include <vector>

namespace switch_watch::common
{
    // Bit i of a port mask is the membership of port i + 1. Masks are 32 bits wide,
    // so ports above 32 cannot be represented; callers clamp totalPorts.
    class BitmaskCodec
    {
    public:
        static constexpr int MAX_MASK_PORTS = 32;

        static std::vector<int> Decode(std::uint32_t mask, int totalPorts);

        // Ports outside [1, 32] are ignored.
        static std::uint32_t Encode(const std::vector<int> &ports);
    };
}
