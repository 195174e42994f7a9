#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "MonitoringLoop.hpp"

namespace switch_watch::monitor
{
    class MonitorScheduler
    {
    public:
        ~MonitorScheduler();

        void Register(const std::string &name, std::shared_ptr<MonitoringLoop> loop);
        std::shared_ptr<MonitoringLoop> Get(const std::string &name) const;
        bool Unregister(const std::string &name);

        void StartAll(const EventCallback &callback);
        void StopAll();

        std::vector<std::string> Names() const;

    private:
        std::unordered_map<std::string, std::shared_ptr<MonitoringLoop>> m_loops;
    };
}
