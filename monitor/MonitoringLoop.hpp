#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "DiffEngine.hpp"
#include "MonitorConfig.hpp"
#include "../device/DeviceSession.hpp"
#include "../device/ReachabilityProbe.hpp"
#include "../history/HistoryRecorder.hpp"

namespace switch_watch::monitor
{
    using EventCallback = std::function<void(const common::ChangeEvent &event)>;

    enum class LoopState
    {
        Disconnected,
        Authenticating,
        Connected
    };

    const char *ToString(LoopState state);

    // Polls one switch on its own thread: fetch all pages, parse, diff against
    // the previous snapshot, emit events. Renews the session cookie before it
    // expires and backs off exponentially while the device is unreachable.
    class MonitoringLoop
    {
    public:
        MonitoringLoop(std::string device,
                       std::shared_ptr<device::DeviceSession> session,
                       history::ConnectivityReporter *reporter,
                       MonitorConfig config,
                       std::shared_ptr<device::ReachabilityProbe> probe = nullptr);
        ~MonitoringLoop();

        MonitoringLoop(const MonitoringLoop &) = delete;
        MonitoringLoop &operator=(const MonitoringLoop &) = delete;

        void Start(EventCallback callback);

        // Cancels an in-flight poll, joins the thread and logs the session out.
        void Stop();
        bool IsRunning() const { return m_running; }

        // One full poll cycle; true when every page was fetched. Returns false
        // at once if another poll of this device is still running.
        bool RunOnce();

        // Re-login ahead of expiry; true on success.
        bool RenewSession();

        void SetEventCallback(EventCallback callback);

        bool IsAuthenticated() const;
        std::optional<common::TimePoint> LastSuccessfulConnection() const;
        std::optional<common::TimePoint> LastCookieRenewal() const;
        std::optional<common::DeviceSnapshot> GetLatestSnapshot() const;
        LoopState GetState() const;
        int ConsecutiveFailures() const;

        // Delay before the next poll given the current failure count.
        std::chrono::milliseconds NextPollDelay() const;
        std::optional<common::TimePoint> RenewalDueAt() const;

        static std::chrono::milliseconds ComputeBackoff(std::chrono::milliseconds base,
                                                        std::chrono::milliseconds max,
                                                        int failures);

        const std::string &Device() const { return m_device; }

    private:
        void Run();
        bool FetchPage(const char *endpoint, std::string &body, std::chrono::milliseconds &latency);
        void HandleFailure(const device::TransportError &error);
        void HandleSuccess(common::DeviceSnapshot snapshot, std::chrono::milliseconds latency);
        void Emit(const common::ChangeEvent &event);
        std::string ProbeDetail();

        std::string m_device;
        std::shared_ptr<device::DeviceSession> m_session;
        history::ConnectivityReporter *m_reporter;
        MonitorConfig m_config;
        std::shared_ptr<device::ReachabilityProbe> m_probe;
        DiffEngine m_diff;

        std::atomic<bool> m_running;
        std::thread m_thread;
        std::mutex m_pollMutex;
        std::mutex m_waitMutex;
        std::condition_variable m_wakeup;

        mutable std::mutex m_mutex;
        EventCallback m_callback;
        LoopState m_state = LoopState::Disconnected;
        std::optional<common::DeviceSnapshot> m_latest;
        std::optional<bool> m_lastReachable;
        std::optional<common::TimePoint> m_lastSuccess;
        std::optional<common::TimePoint> m_lastRenewal;
        std::optional<common::TimePoint> m_downSince;
        int m_failures = 0;
        bool m_lastFailureWasAuth = false;
    };
}
