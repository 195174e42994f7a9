#include "MonitoringLoop.hpp"
#include "../common/Endpoints.hpp"
#include "../common/ResponseParser.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace switch_watch::monitor
{
    namespace
    {
        using SteadyClock = std::chrono::steady_clock;
        constexpr std::chrono::milliseconds MIN_WAIT{10};
        constexpr int MAX_BACKOFF_SHIFT = 20;

        long long Seconds(common::TimePoint from, common::TimePoint to)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
        }
    }

    const char *ToString(LoopState state)
    {
        switch (state)
        {
        case LoopState::Disconnected:
            return "disconnected";
        case LoopState::Authenticating:
            return "authenticating";
        case LoopState::Connected:
            return "connected";
        }
        return "unknown";
    }

    MonitoringLoop::MonitoringLoop(std::string device,
                                   std::shared_ptr<device::DeviceSession> session,
                                   history::ConnectivityReporter *reporter,
                                   MonitorConfig config,
                                   std::shared_ptr<device::ReachabilityProbe> probe)
        : m_device(std::move(device)),
          m_session(std::move(session)),
          m_reporter(reporter),
          m_config(std::move(config)),
          m_probe(std::move(probe)),
          m_diff(m_device),
          m_running(false)
    {
    }

    MonitoringLoop::~MonitoringLoop()
    {
        Stop();
    }

    void MonitoringLoop::Start(EventCallback callback)
    {
        if (m_running)
            return;

        SetEventCallback(std::move(callback));
        m_session->Resume();
        m_running = true;
        m_thread = std::thread(&MonitoringLoop::Run, this);
        std::cout << "[Monitor] Watching " << m_device << " every "
                  << std::chrono::duration_cast<std::chrono::seconds>(m_config.poll_interval).count() << "s\n";
    }

    void MonitoringLoop::Stop()
    {
        if (!m_running && !m_thread.joinable())
            return;

        m_running = false;
        m_session->Cancel();
        {
            std::lock_guard<std::mutex> lock(m_waitMutex);
            m_wakeup.notify_all();
        }
        if (m_thread.joinable())
            m_thread.join();

        m_session->Logout();
        m_session->Resume();
        std::cout << "[Monitor] Stopped watching " << m_device << "\n";
    }

    void MonitoringLoop::SetEventCallback(EventCallback callback)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_callback = std::move(callback);
    }

    std::chrono::milliseconds MonitoringLoop::ComputeBackoff(std::chrono::milliseconds base,
                                                             std::chrono::milliseconds max,
                                                             int failures)
    {
        if (failures <= 1)
            return std::min(base, max);

        const int shift = std::min(failures - 1, MAX_BACKOFF_SHIFT);
        const std::chrono::milliseconds delay(base.count() * (1LL << shift));
        return std::min(delay, max);
    }

    std::chrono::milliseconds MonitoringLoop::NextPollDelay() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Rejected credentials are retried at the normal pace.
        if (m_failures == 0 || m_lastFailureWasAuth)
            return m_config.poll_interval;
        return ComputeBackoff(m_config.poll_interval, m_config.max_backoff, m_failures);
    }

    std::optional<common::TimePoint> MonitoringLoop::RenewalDueAt() const
    {
        const common::SessionState state = m_session->GetSessionState();
        if (!state.authenticated)
            return std::nullopt;

        const auto lifetime = state.expires_at - state.issued_at;
        return state.issued_at + std::chrono::duration_cast<common::Clock::duration>(lifetime * m_config.renewal_fraction);
    }

    bool MonitoringLoop::RenewSession()
    {
        std::cout << "[Monitor] Renewing session cookie for " << m_device << "\n";

        device::LoginResult login = m_session->Relogin();
        if (!login.success)
        {
            std::cerr << "[Monitor] Session renewal for " << m_device << " failed: " << login.error.message << "\n";
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastRenewal = common::Clock::now();
        return true;
    }

    bool MonitoringLoop::FetchPage(const char *endpoint, std::string &body, std::chrono::milliseconds &latency)
    {
        device::ExecuteResult result = m_session->Execute(endpoint);
        if (!result.success)
        {
            HandleFailure(result.error);
            return false;
        }
        body = std::move(result.body);
        latency = result.latency;
        return true;
    }

    bool MonitoringLoop::RunOnce()
    {
        std::unique_lock<std::mutex> poll(m_pollMutex, std::try_to_lock);
        if (!poll.owns_lock())
        {
            std::cerr << "[Monitor] Poll of " << m_device << " already in progress, skipping\n";
            return false;
        }

        const auto now = common::Clock::now();
        const auto renewalDue = RenewalDueAt();

        if (!m_session->IsAuthenticated() || (renewalDue && now >= *renewalDue))
        {
            const bool renewing = m_session->IsAuthenticated();
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!renewing)
                    m_state = LoopState::Authenticating;
            }

            device::LoginResult login = m_session->Relogin();
            if (!login.success)
            {
                HandleFailure(device::ToTransportError(login.error));
                return false;
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastRenewal = common::Clock::now();
        }

        std::string systemPage;
        std::string portPage;
        std::string vlanPage;
        std::string cablePage;
        std::chrono::milliseconds latency{0};
        std::chrono::milliseconds ignored{0};

        if (!FetchPage(protocol::endpoint::SYSTEM_INFO, systemPage, latency) ||
            !FetchPage(protocol::endpoint::PORT_SETTINGS, portPage, ignored) ||
            !FetchPage(protocol::endpoint::VLAN_CONFIG, vlanPage, ignored) ||
            !FetchPage(protocol::endpoint::CABLE_DIAGNOSTIC, cablePage, ignored))
            return false;

        const std::optional<common::DeviceSnapshot> previous = GetLatestSnapshot();

        common::DeviceSnapshot snapshot;
        snapshot.captured_at = common::Clock::now();

        common::SystemInfo info = common::ResponseParser::ParseSystemInfo(systemPage);
        common::PortTable ports = common::ResponseParser::ParsePortTable(portPage);
        common::VlanConfig vlans = common::ResponseParser::ParseVlanConfig(vlanPage);
        common::CableDiagnostics cables = common::ResponseParser::ParseCableDiagnostics(cablePage);

        // An unrecognized page keeps the last known fragment instead of reading as mass deletion.
        if (info.quality == common::ParseQuality::Defaulted)
        {
            std::cerr << "[Monitor] " << m_device << ": system info page not recognized\n";
            snapshot.system_info = previous ? previous->system_info : info;
        }
        else
        {
            snapshot.system_info = info;
        }

        if (ports.quality == common::ParseQuality::Defaulted)
        {
            std::cerr << "[Monitor] " << m_device << ": port page not recognized\n";
            if (previous)
                snapshot.ports = previous->ports;
        }
        else
        {
            snapshot.ports = std::move(ports.ports);
        }

        if (vlans.quality == common::ParseQuality::Defaulted)
        {
            std::cerr << "[Monitor] " << m_device << ": VLAN page not recognized\n";
            if (previous)
                snapshot.vlans = previous->vlans;
        }
        else
        {
            snapshot.vlans = std::move(vlans.vlans);
        }

        if (cables.quality == common::ParseQuality::Defaulted)
        {
            if (previous)
                snapshot.cable_diagnostics = previous->cable_diagnostics;
        }
        else
        {
            snapshot.cable_diagnostics = std::move(cables.diagnostics);
        }

        HandleSuccess(std::move(snapshot), latency);
        return true;
    }

    std::string MonitoringLoop::ProbeDetail()
    {
        if (!m_probe || !m_config.icmp_probe)
            return "";

        std::optional<double> rtt = m_probe->Probe(m_session->Host(), m_config.probe_timeout);
        if (!rtt)
            return "; host silent on ICMP";

        std::ostringstream out;
        out << "; host answers ICMP in " << std::fixed << std::setprecision(1) << *rtt << " ms";
        return out.str();
    }

    void MonitoringLoop::HandleFailure(const device::TransportError &error)
    {
        if (error.kind == device::TransportErrorKind::Cancelled)
        {
            std::cout << "[Monitor] Poll of " << m_device << " cancelled\n";
            return;
        }

        const auto now = common::Clock::now();
        std::optional<bool> previousReachable;
        std::optional<common::TimePoint> lastSuccess;
        bool transition = false;
        int failures = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_failures;
            failures = m_failures;
            m_lastFailureWasAuth = error.kind == device::TransportErrorKind::AuthFailed;
            m_state = LoopState::Disconnected;
            previousReachable = m_lastReachable;
            transition = m_lastReachable != false;
            m_lastReachable = false;
            if (!m_downSince)
                m_downSince = now;
            lastSuccess = m_lastSuccess;
        }

        std::cerr << "[Monitor] Poll of " << m_device << " failed (" << device::ToString(error.kind) << ", attempt "
                  << failures << "): " << error.message << "\n";

        m_session->Logout();

        if (!transition)
            return;

        std::string detail = error.message;
        if (lastSuccess)
            detail += "; unreachable for " + std::to_string(Seconds(*lastSuccess, now)) + "s since last success";
        detail += ProbeDetail();

        Emit(DiffEngine::MakeConnectivityEvent(m_device, previousReachable, false, detail, now));
        if (m_reporter)
            m_reporter->Report(false, std::nullopt, detail);
    }

    void MonitoringLoop::HandleSuccess(common::DeviceSnapshot snapshot, std::chrono::milliseconds latency)
    {
        const auto now = common::Clock::now();
        std::optional<common::DeviceSnapshot> previous;
        std::optional<bool> previousReachable;
        std::optional<common::TimePoint> downSince;
        bool transition = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            previous = m_latest;
            previousReachable = m_lastReachable;
            transition = m_lastReachable != true;
            downSince = m_downSince;

            m_lastReachable = true;
            m_downSince.reset();
            m_failures = 0;
            m_lastFailureWasAuth = false;
            m_state = LoopState::Connected;
            m_lastSuccess = now;
            m_latest = snapshot;
        }

        if (transition)
        {
            std::string detail = "latency " + std::to_string(latency.count()) + " ms";
            if (downSince)
                detail += ", down for " + std::to_string(Seconds(*downSince, now)) + "s";

            std::cout << "[Monitor] " << m_device << " reachable (" << detail << ")\n";
            Emit(DiffEngine::MakeConnectivityEvent(m_device, previousReachable, true, detail, now));
            if (m_reporter)
                m_reporter->Report(true, static_cast<long>(latency.count()), std::nullopt);
        }

        for (const auto &event : m_diff.Diff(previous ? &*previous : nullptr, snapshot))
            Emit(event);
    }

    void MonitoringLoop::Emit(const common::ChangeEvent &event)
    {
        EventCallback callback;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            callback = m_callback;
        }
        if (callback)
            callback(event);
    }

    void MonitoringLoop::Run()
    {
        auto nextPoll = SteadyClock::now();

        while (m_running)
        {
            if (SteadyClock::now() >= nextPoll)
            {
                RunOnce();
                nextPoll = SteadyClock::now() + NextPollDelay();
            }
            else if (auto due = RenewalDueAt(); due && common::Clock::now() >= *due)
            {
                if (!RenewSession())
                    nextPoll = SteadyClock::now();
            }

            if (!m_running)
                break;

            auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(nextPoll - SteadyClock::now());
            if (auto due = RenewalDueAt())
            {
                auto untilRenewal = std::chrono::duration_cast<std::chrono::milliseconds>(*due - common::Clock::now());
                wait = std::min(wait, untilRenewal);
            }
            wait = std::max(wait, MIN_WAIT);

            std::unique_lock<std::mutex> lock(m_waitMutex);
            m_wakeup.wait_for(lock, wait, [this]
                              { return !m_running; });
        }
    }

    bool MonitoringLoop::IsAuthenticated() const
    {
        return m_session->IsAuthenticated();
    }

    std::optional<common::TimePoint> MonitoringLoop::LastSuccessfulConnection() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastSuccess;
    }

    std::optional<common::TimePoint> MonitoringLoop::LastCookieRenewal() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lastRenewal;
    }

    std::optional<common::DeviceSnapshot> MonitoringLoop::GetLatestSnapshot() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_latest;
    }

    LoopState MonitoringLoop::GetState() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }

    int MonitoringLoop::ConsecutiveFailures() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_failures;
    }
}
