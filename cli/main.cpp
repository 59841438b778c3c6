#include "../common/AddressText.hpp"
#include "../common/DiscoverySettings.hpp"
#include "../common/NetworkRange.hpp"
#include "../discovery/DiscoveryEngine.hpp"
#include "../discovery/HostnameResolver.hpp"
#include "../discovery/PosixCommandRunner.hpp"
#include "../storage/DatabaseManager.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace
{
    constexpr int MAX_LOG_LIMIT = 100000;

    void PrintUsage()
    {
        std::cout << "Usage: ./whoshome-discovery <db_path> <command> [args]\n"
                  << "  discover                 sweep the configured network range\n"
                  << "  check <MAC>              is this device on the network right now\n"
                  << "  track <MAC> [nickname]   add a device to the tracked list\n"
                  << "  untrack <MAC>            remove a tracked device\n"
                  << "  list                     show tracked devices\n"
                  << "  refresh                  re-check every tracked device once\n"
                  << "  settings                 show the effective discovery settings\n"
                  << "  set <key> <value>        change one setting\n"
                  << "  log [limit]              show recent discovery log entries\n";
    }

    std::string OrDash(const std::optional<std::string> &value)
    {
        return value ? *value : "-";
    }

    int RunDiscover(whos_home::discovery::DiscoveryEngine &engine)
    {
        whos_home::common::ScanReport report = engine.DiscoverAll();
        for (const auto &host : report)
        {
            std::cout << host.ip_address << "\t" << OrDash(host.mac_address) << "\t" << OrDash(host.hostname) << "\t"
                      << (host.method_used ? whos_home::common::ToString(*host.method_used) : "-") << "\n";
        }
        std::cout << report.size() << " device(s) online\n";
        return 0;
    }

    int RunRefresh(whos_home::discovery::DiscoveryEngine &engine, whos_home::storage::DatabaseManager &db)
    {
        int changed = 0;
        for (const auto &device : db.GetTrackedDevices())
        {
            bool online = engine.CheckStatus(device.mac_address);
            if (online == device.is_online)
                continue;

            if (db.UpdateDeviceStatus(device.mac_address, online))
            {
                ++changed;
                std::cout << device.mac_address << " is now " << (online ? "online" : "offline") << "\n";
            }
        }
        std::cout << "[Refresh] " << changed << " device(s) changed status\n";
        return 0;
    }

    int RunSet(whos_home::storage::DatabaseManager &db, const std::string &key, const std::string &value)
    {
        const auto known = whos_home::common::DiscoverySettings{}.ToKeyValues();
        if (known.find(key) == known.end())
        {
            std::cerr << "Unknown setting: " << key << "\n";
            return 1;
        }

        whos_home::common::SettingsPatch patch = whos_home::common::SettingsPatch::FromKeyValues({{key, value}});
        bool accepted = patch.methods.has_value() || patch.network_range.has_value() ||
                        patch.ping_timeout_seconds.has_value() || patch.arping_timeout_seconds.has_value() ||
                        patch.scan_interval_seconds.has_value();
        if (!accepted || (patch.methods && patch.methods->empty()))
        {
            std::cerr << "Invalid value for " << key << ": " << value << "\n";
            return 1;
        }

        if (patch.network_range && *patch.network_range != whos_home::common::AUTO_RANGE)
            whos_home::common::NetworkRange::Parse(*patch.network_range);

        // Store the canonical rendering, not the raw argument.
        const auto merged = whos_home::common::DiscoverySettings{}.Merge(patch).ToKeyValues();
        if (!db.UpdateSettings({{key, merged.at(key)}}))
        {
            std::cerr << "Failed to update setting " << key << "\n";
            return 1;
        }
        std::cout << key << " = " << merged.at(key) << "\n";
        return 0;
    }
}

int main(int argc, char *argv[])
{
    if (argc < 3)
    {
        PrintUsage();
        return 1;
    }

    std::string db_path = argv[1];
    std::string command = argv[2];

    whos_home::storage::DatabaseManager db;
    if (!db.Initialize(db_path))
    {
        std::cerr << "Could not open database " << db_path << "\n";
        return 1;
    }

    whos_home::discovery::DiscoveryEngine engine(std::make_shared<whos_home::discovery::PosixCommandRunner>(),
                                                 std::make_shared<whos_home::discovery::SystemHostnameResolver>(),
                                                 &db, db.LoadDiscoverySettings());

    try
    {
        if (command == "discover")
            return RunDiscover(engine);

        if (command == "check" && argc > 3)
        {
            std::cout << (engine.CheckStatus(argv[3]) ? "online" : "offline") << "\n";
            return 0;
        }

        if (command == "track" && argc > 3)
        {
            auto mac = whos_home::common::NormalizeMac(argv[3]);
            if (!mac)
            {
                std::cerr << "Not a hardware address: " << argv[3] << "\n";
                return 1;
            }
            std::string nickname = (argc > 4) ? argv[4] : "";
            if (!db.AddTrackedDevice(*mac, nickname))
                return 1;
            std::cout << "Tracking " << *mac << "\n";
            return 0;
        }

        if (command == "untrack" && argc > 3)
        {
            std::string mac = whos_home::common::NormalizeMac(argv[3]).value_or(argv[3]);
            if (!db.RemoveTrackedDevice(mac))
            {
                std::cerr << "Not tracked: " << argv[3] << "\n";
                return 1;
            }
            std::cout << "Stopped tracking " << mac << "\n";
            return 0;
        }

        if (command == "list")
        {
            for (const auto &device : db.GetTrackedDevices())
            {
                std::cout << device.mac_address << "\t" << (device.nickname.empty() ? "-" : device.nickname) << "\t"
                          << (device.is_online ? "online" : "offline") << "\t"
                          << (device.last_seen.empty() ? "never" : device.last_seen) << "\n";
            }
            return 0;
        }

        if (command == "refresh")
            return RunRefresh(engine, db);

        if (command == "settings")
        {
            for (const auto &[key, value] : engine.GetSettings().ToKeyValues())
                std::cout << key << " = " << value << "\n";
            return 0;
        }

        if (command == "set" && argc > 4)
            return RunSet(db, argv[3], argv[4]);

        if (command == "log")
        {
            std::optional<int> limit = (argc > 3) ? whos_home::common::ParsePositiveInt(argv[3], MAX_LOG_LIMIT) : std::optional<int>(50);
            if (!limit)
            {
                std::cerr << "Invalid log limit: " << argv[3] << "\n";
                PrintUsage();
                return 1;
            }

            for (const auto &entry : db.GetRecentDiscoveries(*limit))
            {
                std::cout << entry.timestamp << "\t" << entry.ip_address << "\t"
                          << (entry.mac_address.empty() ? "-" : entry.mac_address) << "\t"
                          << (entry.method.empty() ? "-" : entry.method) << "\t"
                          << (entry.success ? "ok" : "failed") << "\n";
            }
            return 0;
        }
    }
    catch (const whos_home::common::InvalidRangeError &e)
    {
        std::cerr << e.what() << "\n";
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Error: " << e.what() << '\n';
        return 1;
    }

    PrintUsage();
    return 1;
}
