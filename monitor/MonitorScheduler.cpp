#include "MonitorScheduler.hpp"
#include <algorithm>

namespace switch_watch::monitor
{
    MonitorScheduler::~MonitorScheduler()
    {
        StopAll();
    }

    void MonitorScheduler::Register(const std::string &name, std::shared_ptr<MonitoringLoop> loop)
    {
        if (!loop)
            return;
        m_loops[name] = std::move(loop);
    }

    std::shared_ptr<MonitoringLoop> MonitorScheduler::Get(const std::string &name) const
    {
        auto it = m_loops.find(name);
        if (it == m_loops.end())
            return nullptr;
        return it->second;
    }

    bool MonitorScheduler::Unregister(const std::string &name)
    {
        auto it = m_loops.find(name);
        if (it == m_loops.end())
            return false;

        it->second->Stop();
        m_loops.erase(it);
        return true;
    }

    void MonitorScheduler::StartAll(const EventCallback &callback)
    {
        for (const auto &pair : m_loops)
        {
            if (pair.second)
                pair.second->Start(callback);
        }
    }

    void MonitorScheduler::StopAll()
    {
        for (const auto &pair : m_loops)
        {
            if (pair.second)
                pair.second->Stop();
        }
    }

    std::vector<std::string> MonitorScheduler::Names() const
    {
        std::vector<std::string> names;
        for (const auto &pair : m_loops)
            names.push_back(pair.first);
        std::sort(names.begin(), names.end());
        return names;
    }
}
