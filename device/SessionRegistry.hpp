#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "DeviceSession.hpp"

namespace switch_watch::device
{
    struct DeviceAddress
    {
        std::string host;
        int port = protocol::DEFAULT_HTTP_PORT;
        bool use_tls = false;

        // "http://10.0.0.2:80"
        std::string Key() const;
    };

    using TransportFactory = std::function<std::shared_ptr<HttpTransport>(const DeviceAddress &address)>;

    // Host identity -> the one DeviceSession for that switch. Constructed
    // explicitly and handed to whoever needs sessions.
    class SessionRegistry
    {
    private:
        TransportFactory m_factory;
        SessionOptions m_options;

        std::unordered_map<std::string, std::shared_ptr<DeviceSession>> m_sessions;
        mutable std::mutex m_mutex;

    public:
        explicit SessionRegistry(TransportFactory factory, SessionOptions options = {});

        // Returns the existing session for the address or creates one.
        std::shared_ptr<DeviceSession> Acquire(const DeviceAddress &address);
        std::shared_ptr<DeviceSession> Find(const DeviceAddress &address) const;

        // Logs the session out before dropping it.
        bool Remove(const DeviceAddress &address);
        void Clear();

        std::vector<std::string> Keys() const;
        std::size_t Size() const;
    };

    // Sockets + OpenSSL transport for real devices.
    TransportFactory MakeSocketTransportFactory();
}
