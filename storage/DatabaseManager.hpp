#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "../common/DiscoverySettings.hpp"
#include "../discovery/DiscoveryRecorder.hpp"

namespace whos_home::storage
{
    struct TrackedDeviceRecord
    {
        std::string mac_address;
        std::string nickname;
        bool is_online = false;
        std::string last_seen;
        std::string created_at;
    };

    struct DiscoveryLogRecord
    {
        int id = 0;
        std::string mac_address;
        std::string ip_address;
        std::string method;
        bool success = false;
        std::string timestamp;
    };

    // Settings, tracked devices and the discovery audit log in one sqlite file.
    class DatabaseManager : public discovery::DiscoveryRecorder
    {
    private:
        sqlite3 *db_;
        mutable std::mutex db_mutex_;

        // Caller holds db_mutex_.
        void CloseLocked();

    public:
        DatabaseManager();
        ~DatabaseManager() override;

        DatabaseManager(const DatabaseManager &) = delete;
        DatabaseManager &operator=(const DatabaseManager &) = delete;

        bool Initialize(const std::string &db_path);
        void Shutdown();

        std::map<std::string, std::string> GetSettings() const;
        common::DiscoverySettings LoadDiscoverySettings() const;
        bool UpdateSettings(const std::map<std::string, std::string> &values);

        bool AddTrackedDevice(const std::string &mac, const std::string &nickname);
        bool RemoveTrackedDevice(const std::string &mac);
        std::vector<TrackedDeviceRecord> GetTrackedDevices() const;
        bool UpdateDeviceStatus(const std::string &mac, bool is_online);

        void RecordAttempt(const common::DiscoveryAttempt &attempt) override;
        std::vector<DiscoveryLogRecord> GetRecentDiscoveries(int limit = 50) const;
    };
}
