#include "BitmaskCodec.hpp"
#include <algorithm>

namespace switch_watch::common
{
    std::vector<int> BitmaskCodec::Decode(std::uint32_t mask, int totalPorts)
    {
        std::vector<int> ports;
        const int limit = std::min(totalPorts, MAX_MASK_PORTS);

        for (int i = 0; i < limit; ++i)
        {
            if (mask & (std::uint32_t{1} << i))
                ports.push_back(i + 1);
        }
        return ports;
    }

    std::uint32_t BitmaskCodec::Encode(const std::vector<int> &ports)
    {
        std::uint32_t mask = 0;
        for (int port : ports)
        {
            if (port < 1 || port > MAX_MASK_PORTS)
                continue;
            mask |= std::uint32_t{1} << (port - 1);
        }
        return mask;
    }
}
