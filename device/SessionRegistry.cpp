#include "SessionRegistry.hpp"
#include "SocketHttpTransport.hpp"
#include <algorithm>
#include <iostream>

namespace switch_watch::device
{
    std::string DeviceAddress::Key() const
    {
        return std::string(use_tls ? "https://" : "http://") + host + ":" + std::to_string(port);
    }

    SessionRegistry::SessionRegistry(TransportFactory factory, SessionOptions options)
        : m_factory(std::move(factory)), m_options(options)
    {
    }

    std::shared_ptr<DeviceSession> SessionRegistry::Acquire(const DeviceAddress &address)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        const std::string key = address.Key();
        auto it = m_sessions.find(key);
        if (it != m_sessions.end())
            return it->second;

        auto session = std::make_shared<DeviceSession>(address.host, m_factory(address), m_options);
        m_sessions[key] = session;
        std::cout << "[SessionRegistry] Registered " << key << "\n";
        return session;
    }

    std::shared_ptr<DeviceSession> SessionRegistry::Find(const DeviceAddress &address) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_sessions.find(address.Key());
        if (it == m_sessions.end())
            return nullptr;
        return it->second;
    }

    bool SessionRegistry::Remove(const DeviceAddress &address)
    {
        std::shared_ptr<DeviceSession> session;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_sessions.find(address.Key());
            if (it == m_sessions.end())
                return false;
            session = std::move(it->second);
            m_sessions.erase(it);
        }

        session->Logout();
        return true;
    }

    void SessionRegistry::Clear()
    {
        std::unordered_map<std::string, std::shared_ptr<DeviceSession>> sessions;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            sessions.swap(m_sessions);
        }

        for (auto &pair : sessions)
            pair.second->Logout();
    }

    std::vector<std::string> SessionRegistry::Keys() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::vector<std::string> keys;
        for (const auto &pair : m_sessions)
            keys.push_back(pair.first);
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    std::size_t SessionRegistry::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sessions.size();
    }

    TransportFactory MakeSocketTransportFactory()
    {
        return [](const DeviceAddress &address)
        {
            return std::make_shared<SocketHttpTransport>(address.host, address.port, address.use_tls);
        };
    }
}
