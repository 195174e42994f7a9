#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../common/Types.hpp"

namespace switch_watch::monitor
{
    // Field-by-field comparison of consecutive snapshots. Diff(s, s) is empty;
    // a null previous yields one PERIODIC_SNAPSHOT baseline per entity.
    class DiffEngine
    {
    public:
        explicit DiffEngine(std::string device = "");

        std::vector<common::ChangeEvent> Diff(const common::DeviceSnapshot *previous,
                                              const common::DeviceSnapshot &current) const;

        // previousReachable is empty on the first observation.
        static common::ChangeEvent MakeConnectivityEvent(const std::string &device,
                                                         std::optional<bool> previousReachable,
                                                         bool reachable,
                                                         const std::string &detail,
                                                         common::TimePoint when);

        const std::string &Device() const { return m_device; }

    private:
        std::string m_device;

        common::ChangeEvent MakeEvent(const char *entityType, int key, common::ChangeKind kind,
                                      std::string previousValue, std::string newValue,
                                      common::TimePoint when) const;

        void Baseline(const common::DeviceSnapshot &current, std::vector<common::ChangeEvent> &events) const;
        void DiffSystem(const common::DeviceSnapshot &previous, const common::DeviceSnapshot &current,
                        std::vector<common::ChangeEvent> &events) const;
        void DiffPorts(const common::DeviceSnapshot &previous, const common::DeviceSnapshot &current,
                       std::vector<common::ChangeEvent> &events) const;
        void DiffVlans(const common::DeviceSnapshot &previous, const common::DeviceSnapshot &current,
                       std::vector<common::ChangeEvent> &events) const;
        void DiffCables(const common::DeviceSnapshot &previous, const common::DeviceSnapshot &current,
                        std::vector<common::ChangeEvent> &events) const;
    };
}
