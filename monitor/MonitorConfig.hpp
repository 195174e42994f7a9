#pragma once

#include <chrono>
#include <string>
#include "../device/DeviceSession.hpp"

namespace switch_watch::monitor
{
    struct MonitorConfig
    {
        std::chrono::milliseconds poll_interval = std::chrono::seconds(30);
        std::chrono::milliseconds max_backoff = std::chrono::minutes(5);

        // Re-login once this share of the session lifetime has passed.
        double renewal_fraction = 0.5;

        device::SessionOptions session;

        bool icmp_probe = true;
        std::chrono::milliseconds probe_timeout = std::chrono::seconds(1);

        std::string database_path = "switch_history.db";
    };
}
