#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "HistoryRecorder.hpp"

namespace switch_watch::history
{
    struct StoredEvent
    {
        long long id = 0;
        common::ChangeEvent event;
    };

    struct ConnectivityRecord
    {
        long long id = 0;
        std::string device;
        bool reachable = false;
        std::optional<long> latency_ms;
        std::string error_message;
        common::TimePoint recorded_at{};
    };

    class HistoryStore : public HistoryRecorder
    {
    private:
        sqlite3 *db_;
        mutable std::mutex db_mutex_;

        std::vector<StoredEvent> QueryEvents(const char *sql, const std::string &device,
                                             const std::string *entityType, int entityKey, int limit) const;

    public:
        HistoryStore();
        ~HistoryStore() override;

        HistoryStore(const HistoryStore &) = delete;
        HistoryStore &operator=(const HistoryStore &) = delete;

        // Opens (or creates) the database; ":memory:" works for tests.
        bool Initialize(const std::string &db_path);
        void Shutdown();
        bool IsOpen() const;

        void Record(const common::ChangeEvent &event) override;
        bool SaveEvent(const common::ChangeEvent &event);

        bool SaveConnectivity(const std::string &device, bool reachable, std::optional<long> latencyMs,
                              const std::string &errorMessage, common::TimePoint when);

        // Newest first.
        std::vector<StoredEvent> GetEvents(const std::string &device, const std::string &entityType,
                                           int entityKey, int limit = 50) const;
        std::vector<StoredEvent> GetRecentEvents(const std::string &device, int limit = 50) const;
        std::vector<ConnectivityRecord> GetConnectivity(const std::string &device, int limit = 50) const;
    };

    // ConnectivityReporter that appends to a HistoryStore under one device name.
    class ConnectivityLog : public ConnectivityReporter
    {
    private:
        HistoryStore &m_store;
        std::string m_device;

    public:
        ConnectivityLog(HistoryStore &store, std::string device);

        void Report(bool reachable, std::optional<long> latencyMs, std::optional<std::string> errorMessage) override;
    };
}
