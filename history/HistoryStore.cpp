#include "HistoryStore.hpp"
#include <iostream>

namespace switch_watch::history
{
    namespace
    {
        std::string ColumnText(sqlite3_stmt *stmt, int col)
        {
            const unsigned char *text = sqlite3_column_text(stmt, col);
            return text ? reinterpret_cast<const char *>(text) : "";
        }

        common::TimePoint FromEpochMillis(sqlite3_int64 millis)
        {
            return common::TimePoint(std::chrono::duration_cast<common::Clock::duration>(std::chrono::milliseconds(millis)));
        }
    }

    HistoryStore::HistoryStore() : db_(nullptr) {}

    HistoryStore::~HistoryStore()
    {
        Shutdown();
    }

    bool HistoryStore::Initialize(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        if (db_)
            return true;

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            std::cerr << "[HistoryStore] Open failed: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }

        sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS change_events ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "device TEXT NOT NULL, "
            "entity_type TEXT NOT NULL, "
            "entity_key INTEGER NOT NULL, "
            "change_kind TEXT NOT NULL, "
            "previous_value TEXT, "
            "new_value TEXT, "
            "recorded_at INTEGER NOT NULL"
            ");"

            "CREATE INDEX IF NOT EXISTS idx_change_events_entity "
            "ON change_events(device, entity_type, entity_key, recorded_at);"

            "CREATE TABLE IF NOT EXISTS connectivity ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "device TEXT NOT NULL, "
            "reachable INTEGER NOT NULL, "
            "latency_ms INTEGER, "
            "error_message TEXT DEFAULT '', "
            "recorded_at INTEGER NOT NULL"
            ");";

        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql_tables, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[HistoryStore] Schema error: " << err_msg << std::endl;
            sqlite3_free(err_msg);
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
        return true;
    }

    void HistoryStore::Shutdown()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool HistoryStore::IsOpen() const
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        return db_ != nullptr;
    }

    void HistoryStore::Record(const common::ChangeEvent &event)
    {
        if (!SaveEvent(event))
        {
            std::cerr << "[HistoryStore] Dropped " << common::ToString(event.change_kind) << " for "
                      << event.entity_type << " " << event.entity_key << "\n";
        }
    }

    bool HistoryStore::SaveEvent(const common::ChangeEvent &event)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        const char *sql =
            "INSERT INTO change_events (device, entity_type, entity_key, change_kind, previous_value, new_value, recorded_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[HistoryStore] Prepare failed: " << sqlite3_errmsg(db_) << std::endl;
            return false;
        }

        sqlite3_bind_text(stmt, 1, event.device.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, event.entity_type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 3, event.entity_key);
        sqlite3_bind_text(stmt, 4, common::ToString(event.change_kind), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 5, event.previous_value.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, event.new_value.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 7, common::ToEpochMillis(event.timestamp));

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        if (!success)
            std::cerr << "[HistoryStore] Insert failed: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_finalize(stmt);
        return success;
    }

    bool HistoryStore::SaveConnectivity(const std::string &device, bool reachable, std::optional<long> latencyMs,
                                        const std::string &errorMessage, common::TimePoint when)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        const char *sql =
            "INSERT INTO connectivity (device, reachable, latency_ms, error_message, recorded_at) "
            "VALUES (?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[HistoryStore] Prepare failed: " << sqlite3_errmsg(db_) << std::endl;
            return false;
        }

        sqlite3_bind_text(stmt, 1, device.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, reachable ? 1 : 0);
        if (latencyMs)
            sqlite3_bind_int64(stmt, 3, *latencyMs);
        else
            sqlite3_bind_null(stmt, 3);
        sqlite3_bind_text(stmt, 4, errorMessage.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 5, common::ToEpochMillis(when));

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        if (!success)
            std::cerr << "[HistoryStore] Insert failed: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_finalize(stmt);
        return success;
    }

    std::vector<StoredEvent> HistoryStore::QueryEvents(const char *sql, const std::string &device,
                                                       const std::string *entityType, int entityKey, int limit) const
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<StoredEvent> events;
        if (!db_)
            return events;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[HistoryStore] Prepare failed: " << sqlite3_errmsg(db_) << std::endl;
            return events;
        }

        int idx = 1;
        sqlite3_bind_text(stmt, idx++, device.c_str(), -1, SQLITE_TRANSIENT);
        if (entityType)
        {
            sqlite3_bind_text(stmt, idx++, entityType->c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, idx++, entityKey);
        }
        sqlite3_bind_int(stmt, idx, limit);

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            StoredEvent stored;
            stored.id = sqlite3_column_int64(stmt, 0);
            stored.event.device = ColumnText(stmt, 1);
            stored.event.entity_type = ColumnText(stmt, 2);
            stored.event.entity_key = sqlite3_column_int(stmt, 3);
            stored.event.change_kind = common::ParseChangeKind(ColumnText(stmt, 4)).value_or(common::ChangeKind::PeriodicSnapshot);
            stored.event.previous_value = ColumnText(stmt, 5);
            stored.event.new_value = ColumnText(stmt, 6);
            stored.event.timestamp = FromEpochMillis(sqlite3_column_int64(stmt, 7));
            events.push_back(std::move(stored));
        }
        sqlite3_finalize(stmt);
        return events;
    }

    std::vector<StoredEvent> HistoryStore::GetEvents(const std::string &device, const std::string &entityType,
                                                     int entityKey, int limit) const
    {
        const char *sql =
            "SELECT id, device, entity_type, entity_key, change_kind, previous_value, new_value, recorded_at "
            "FROM change_events WHERE device = ? AND entity_type = ? AND entity_key = ? "
            "ORDER BY recorded_at DESC, id DESC LIMIT ?;";
        return QueryEvents(sql, device, &entityType, entityKey, limit);
    }

    std::vector<StoredEvent> HistoryStore::GetRecentEvents(const std::string &device, int limit) const
    {
        const char *sql =
            "SELECT id, device, entity_type, entity_key, change_kind, previous_value, new_value, recorded_at "
            "FROM change_events WHERE device = ? "
            "ORDER BY recorded_at DESC, id DESC LIMIT ?;";
        return QueryEvents(sql, device, nullptr, 0, limit);
    }

    std::vector<ConnectivityRecord> HistoryStore::GetConnectivity(const std::string &device, int limit) const
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<ConnectivityRecord> records;
        if (!db_)
            return records;

        const char *sql =
            "SELECT id, device, reachable, latency_ms, error_message, recorded_at "
            "FROM connectivity WHERE device = ? ORDER BY recorded_at DESC, id DESC LIMIT ?;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[HistoryStore] Prepare failed: " << sqlite3_errmsg(db_) << std::endl;
            return records;
        }

        sqlite3_bind_text(stmt, 1, device.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 2, limit);

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            ConnectivityRecord record;
            record.id = sqlite3_column_int64(stmt, 0);
            record.device = ColumnText(stmt, 1);
            record.reachable = sqlite3_column_int(stmt, 2) != 0;
            if (sqlite3_column_type(stmt, 3) != SQLITE_NULL)
                record.latency_ms = static_cast<long>(sqlite3_column_int64(stmt, 3));
            record.error_message = ColumnText(stmt, 4);
            record.recorded_at = FromEpochMillis(sqlite3_column_int64(stmt, 5));
            records.push_back(std::move(record));
        }
        sqlite3_finalize(stmt);
        return records;
    }

    ConnectivityLog::ConnectivityLog(HistoryStore &store, std::string device)
        : m_store(store), m_device(std::move(device))
    {
    }

    void ConnectivityLog::Report(bool reachable, std::optional<long> latencyMs, std::optional<std::string> errorMessage)
    {
        if (!m_store.SaveConnectivity(m_device, reachable, latencyMs, errorMessage.value_or(""), common::Clock::now()))
            std::cerr << "[HistoryStore] Dropped connectivity record for " << m_device << "\n";
    }
}
