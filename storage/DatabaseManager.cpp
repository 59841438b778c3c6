#include "DatabaseManager.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace whos_home::storage
{
    namespace
    {
        std::string UpperMac(std::string mac)
        {
            std::transform(mac.begin(), mac.end(), mac.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            return mac;
        }

        std::string ColumnText(sqlite3_stmt *stmt, int column)
        {
            const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, column));
            return text ? text : "";
        }
    }

    DatabaseManager::DatabaseManager() : db_(nullptr) {}

    DatabaseManager::~DatabaseManager()
    {
        Shutdown();
    }

    bool DatabaseManager::Initialize(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);

        // Re-initialising replaces the previous connection.
        CloseLocked();

        if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK)
        {
            std::cerr << "[DB] Open failed: " << sqlite3_errmsg(db_) << std::endl;
            CloseLocked();
            return false;
        }

        sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS tracked_devices ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "mac_address TEXT UNIQUE NOT NULL, "
            "nickname TEXT, "
            "is_online BOOLEAN DEFAULT 0, "
            "last_seen TIMESTAMP, "
            "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP, "
            "updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
            ");"

            "CREATE TABLE IF NOT EXISTS settings ("
            "key TEXT PRIMARY KEY, "
            "value TEXT NOT NULL, "
            "updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
            ");"

            "CREATE TABLE IF NOT EXISTS discovery_log ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "mac_address TEXT, "
            "ip_address TEXT, "
            "method TEXT, "
            "success BOOLEAN, "
            "timestamp TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
            ");";

        char *err_msg = nullptr;
        if (sqlite3_exec(db_, sql_tables, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[DB] Schema error: " << err_msg << std::endl;
            sqlite3_free(err_msg);
            CloseLocked();
            return false;
        }

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "INSERT OR IGNORE INTO settings (key, value) VALUES (?, ?);", -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[DB] Seeding defaults failed: " << sqlite3_errmsg(db_) << std::endl;
            CloseLocked();
            return false;
        }

        for (const auto &[key, value] : common::DiscoverySettings{}.ToKeyValues())
        {
            sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt) != SQLITE_DONE)
                std::cerr << "[DB] Seeding '" << key << "' failed: " << sqlite3_errmsg(db_) << std::endl;
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
        sqlite3_finalize(stmt);

        return true;
    }

    void DatabaseManager::Shutdown()
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        CloseLocked();
    }

    void DatabaseManager::CloseLocked()
    {
        if (db_)
        {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    std::map<std::string, std::string> DatabaseManager::GetSettings() const
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::map<std::string, std::string> settings;
        if (!db_)
            return settings;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT key, value FROM settings;", -1, &stmt, nullptr) != SQLITE_OK)
            return settings;

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            settings[ColumnText(stmt, 0)] = ColumnText(stmt, 1);
        }
        sqlite3_finalize(stmt);
        return settings;
    }

    common::DiscoverySettings DatabaseManager::LoadDiscoverySettings() const
    {
        return common::DiscoverySettings{}.Merge(common::SettingsPatch::FromKeyValues(GetSettings()));
    }

    bool DatabaseManager::UpdateSettings(const std::map<std::string, std::string> &values)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        const char *sql = "INSERT OR REPLACE INTO settings (key, value, updated_at) VALUES (?, ?, CURRENT_TIMESTAMP);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        sqlite3_exec(db_, "BEGIN;", nullptr, nullptr, nullptr);

        bool ok = true;
        for (const auto &[key, value] : values)
        {
            sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt) != SQLITE_DONE)
            {
                std::cerr << "[DB] Error updating setting '" << key << "': " << sqlite3_errmsg(db_) << std::endl;
                ok = false;
                break;
            }
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
        }
        sqlite3_finalize(stmt);

        sqlite3_exec(db_, ok ? "COMMIT;" : "ROLLBACK;", nullptr, nullptr, nullptr);
        return ok;
    }

    bool DatabaseManager::AddTrackedDevice(const std::string &mac, const std::string &nickname)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        const char *sql = "INSERT OR REPLACE INTO tracked_devices (mac_address, nickname, updated_at) "
                          "VALUES (?, ?, CURRENT_TIMESTAMP);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        std::string upper = UpperMac(mac);
        sqlite3_bind_text(stmt, 1, upper.c_str(), -1, SQLITE_TRANSIENT);
        if (nickname.empty())
            sqlite3_bind_null(stmt, 2);
        else
            sqlite3_bind_text(stmt, 2, nickname.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        if (!success)
            std::cerr << "[DB] Error adding tracked device: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_finalize(stmt);
        return success;
    }

    bool DatabaseManager::RemoveTrackedDevice(const std::string &mac)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "DELETE FROM tracked_devices WHERE mac_address = ?;", -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        std::string upper = UpperMac(mac);
        sqlite3_bind_text(stmt, 1, upper.c_str(), -1, SQLITE_TRANSIENT);
        bool success = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db_) > 0;
        sqlite3_finalize(stmt);
        return success;
    }

    std::vector<TrackedDeviceRecord> DatabaseManager::GetTrackedDevices() const
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<TrackedDeviceRecord> devices;
        if (!db_)
            return devices;

        const char *sql = "SELECT mac_address, nickname, is_online, last_seen, created_at "
                          "FROM tracked_devices ORDER BY nickname, mac_address;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return devices;

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            TrackedDeviceRecord d;
            d.mac_address = ColumnText(stmt, 0);
            d.nickname = ColumnText(stmt, 1);
            d.is_online = sqlite3_column_int(stmt, 2) != 0;
            d.last_seen = ColumnText(stmt, 3);
            d.created_at = ColumnText(stmt, 4);
            devices.push_back(d);
        }
        sqlite3_finalize(stmt);
        return devices;
    }

    bool DatabaseManager::UpdateDeviceStatus(const std::string &mac, bool is_online)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return false;

        const char *sql = "UPDATE tracked_devices "
                          "SET is_online = ?, last_seen = COALESCE(?, last_seen), updated_at = CURRENT_TIMESTAMP "
                          "WHERE mac_address = ?;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        std::string upper = UpperMac(mac);
        std::string now = common::CurrentTimestamp();
        sqlite3_bind_int(stmt, 1, is_online ? 1 : 0);
        if (is_online)
            sqlite3_bind_text(stmt, 2, now.c_str(), -1, SQLITE_TRANSIENT);
        else
            sqlite3_bind_null(stmt, 2);
        sqlite3_bind_text(stmt, 3, upper.c_str(), -1, SQLITE_TRANSIENT);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE) && sqlite3_changes(db_) > 0;
        sqlite3_finalize(stmt);
        return success;
    }

    void DatabaseManager::RecordAttempt(const common::DiscoveryAttempt &attempt)
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_)
            return;

        const char *sql = "INSERT INTO discovery_log (mac_address, ip_address, method, success, timestamp) "
                          "VALUES (?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[DB] Error logging discovery: " << sqlite3_errmsg(db_) << std::endl;
            return;
        }

        if (attempt.mac_address)
            sqlite3_bind_text(stmt, 1, attempt.mac_address->c_str(), -1, SQLITE_TRANSIENT);
        else
            sqlite3_bind_null(stmt, 1);
        sqlite3_bind_text(stmt, 2, attempt.ip_address.c_str(), -1, SQLITE_TRANSIENT);
        if (attempt.method)
        {
            std::string method = common::ToString(*attempt.method);
            sqlite3_bind_text(stmt, 3, method.c_str(), -1, SQLITE_TRANSIENT);
        }
        else
        {
            sqlite3_bind_null(stmt, 3);
        }
        sqlite3_bind_int(stmt, 4, attempt.success ? 1 : 0);
        sqlite3_bind_text(stmt, 5, attempt.timestamp.c_str(), -1, SQLITE_TRANSIENT);

        if (sqlite3_step(stmt) != SQLITE_DONE)
            std::cerr << "[DB] Error logging discovery: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_finalize(stmt);
    }

    std::vector<DiscoveryLogRecord> DatabaseManager::GetRecentDiscoveries(int limit) const
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        std::vector<DiscoveryLogRecord> records;
        if (!db_ || limit <= 0)
            return records;

        const char *sql = "SELECT id, mac_address, ip_address, method, success, timestamp "
                          "FROM discovery_log ORDER BY id DESC LIMIT ?;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return records;

        sqlite3_bind_int(stmt, 1, limit);
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            DiscoveryLogRecord r;
            r.id = sqlite3_column_int(stmt, 0);
            r.mac_address = ColumnText(stmt, 1);
            r.ip_address = ColumnText(stmt, 2);
            r.method = ColumnText(stmt, 3);
            r.success = sqlite3_column_int(stmt, 4) != 0;
            r.timestamp = ColumnText(stmt, 5);
            records.push_back(r);
        }
        sqlite3_finalize(stmt);
        return records;
    }
}
