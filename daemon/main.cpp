#include "../device/SessionRegistry.hpp"
#include "../history/HistoryStore.hpp"
#include "../monitor/EventDispatcher.hpp"
#include "../monitor/MonitorScheduler.hpp"
#ifdef SWITCH_WATCH_HAVE_TINS
#include "../device/IcmpProbe.hpp"
#endif
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace
{
    std::atomic<bool> g_stop{false};

    void OnSignal(int)
    {
        g_stop = true;
    }

    const char *Env(const char *name)
    {
        const char *value = std::getenv(name);
        return (value && *value) ? value : nullptr;
    }

    void PrintUsage()
    {
        std::cout << "Usage: ./switch_watchd <host> <username> [dbPath] [pollSeconds]\n"
                  << "  SWITCH_WATCH_PASSWORD  device password (required)\n"
                  << "  SWITCH_WATCH_TLS=1     use HTTPS\n"
                  << "  SWITCH_WATCH_PORT      TCP port override\n";
    }
}

int main(int argc, char *argv[])
{
    using namespace switch_watch;

    if (argc < 3)
    {
        PrintUsage();
        return 1;
    }

    const char *password = Env("SWITCH_WATCH_PASSWORD");
    if (!password)
    {
        std::cerr << "[Daemon] SWITCH_WATCH_PASSWORD is not set\n";
        PrintUsage();
        return 1;
    }

    try
    {
        monitor::MonitorConfig config;
        if (argc > 3)
            config.database_path = argv[3];
        if (argc > 4)
            config.poll_interval = std::chrono::seconds(std::stoi(argv[4]));

        device::DeviceAddress address;
        address.host = argv[1];
        const char *tls = Env("SWITCH_WATCH_TLS");
        address.use_tls = tls && std::string(tls) == "1";
        address.port = address.use_tls ? protocol::DEFAULT_HTTPS_PORT : protocol::DEFAULT_HTTP_PORT;
        if (const char *port = Env("SWITCH_WATCH_PORT"))
            address.port = std::stoi(port);

        std::signal(SIGINT, OnSignal);
        std::signal(SIGTERM, OnSignal);
        std::signal(SIGPIPE, SIG_IGN);

        history::HistoryStore store;
        if (!store.Initialize(config.database_path))
            throw std::runtime_error("cannot open history database " + config.database_path);

        device::SessionRegistry registry(device::MakeSocketTransportFactory(), config.session);
        auto session = registry.Acquire(address);

        device::LoginResult login = session->Login(argv[2], password);
        if (!login.success)
            std::cerr << "[Daemon] Initial login failed (" << device::ToString(login.error.kind)
                      << "), monitoring will keep retrying\n";

        std::shared_ptr<device::ReachabilityProbe> probe;
#ifdef SWITCH_WATCH_HAVE_TINS
        if (config.icmp_probe)
            probe = std::make_shared<device::IcmpProbe>();
#endif

        history::ConnectivityLog connectivity(store, address.host);
        monitor::EventDispatcher dispatcher(store);
        dispatcher.Start();

        monitor::MonitorScheduler scheduler;
        scheduler.Register(address.Key(),
                           std::make_shared<monitor::MonitoringLoop>(address.host, session, &connectivity, config, probe));

        scheduler.StartAll([&dispatcher](const common::ChangeEvent &event)
                           {
            std::cout << "[Event] " << common::FormatTimestamp(event.timestamp) << " "
                      << common::ToString(event.change_kind) << " " << event.entity_type << " "
                      << event.entity_key << ": " << event.previous_value << " -> " << event.new_value << "\n";
            dispatcher.Dispatch(event); });

        std::cout << "[Daemon] Running. History in " << config.database_path << "\n";
        while (!g_stop)
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        std::cout << "[Daemon] Shutting down\n";
        scheduler.StopAll();
        dispatcher.Stop();
        registry.Clear();
        store.Shutdown();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Daemon Error: " << e.what() << '\n';
        return -1;
    }

    return 0;
}
