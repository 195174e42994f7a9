#pragma once

#include <optional>
#include <string>
#include "../common/Types.hpp"

namespace switch_watch::history
{
    // Sink for change events. Record must not block the caller for long.
    class HistoryRecorder
    {
    public:
        virtual ~HistoryRecorder() = default;
        virtual void Record(const common::ChangeEvent &event) = 0;
    };

    class ConnectivityReporter
    {
    public:
        virtual ~ConnectivityReporter() = default;
        virtual void Report(bool reachable, std::optional<long> latencyMs, std::optional<std::string> errorMessage) = 0;
    };
}
