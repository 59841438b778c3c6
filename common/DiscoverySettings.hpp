#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "DiscoveryTypes.hpp"

namespace whos_home::common
{
    inline constexpr const char *AUTO_RANGE = "auto";

    // Upper bounds for stored values; larger ones are rejected when parsed.
    inline constexpr double MAX_TIMEOUT_SECONDS = 3600;
    inline constexpr int MAX_SCAN_INTERVAL_SECONDS = 86400;

    struct SettingsPatch
    {
        std::optional<std::vector<ProbeMethod>> methods;
        std::optional<std::string> network_range;
        std::optional<double> ping_timeout_seconds;
        std::optional<double> arping_timeout_seconds;
        std::optional<int> scan_interval_seconds;

        // Flat collaborator keys: scan_interval, discovery_methods, network_range,
        // ping_timeout, arping_timeout. Unknown keys and unparsable values are skipped.
        static SettingsPatch FromKeyValues(const std::map<std::string, std::string> &values);
    };

    // Immutable per-operation snapshot. Replace wholesale through Merge().
    struct DiscoverySettings
    {
        std::vector<ProbeMethod> methods{ProbeMethod::Ping, ProbeMethod::Arping};
        std::string network_range = AUTO_RANGE;
        double ping_timeout_seconds = 1;
        double arping_timeout_seconds = 2;
        int scan_interval_seconds = 30;

        bool IsAutoRange() const { return network_range == AUTO_RANGE; }

        DiscoverySettings Merge(const SettingsPatch &patch) const;

        std::map<std::string, std::string> ToKeyValues() const;
    };

    // Accepts ["ping", "arping"] or ping,arping. Unknown names are dropped.
    std::vector<ProbeMethod> ParseMethodList(const std::string &text);
    std::string FormatMethodList(const std::vector<ProbeMethod> &methods);

    std::string FormatSeconds(double seconds);

    // Decimal digits only, 1..max_value; anything else yields nullopt.
    std::optional<int> ParsePositiveInt(const std::string &text, int max_value);
}
