#include "StatusChecker.hpp"
#include "../common/AddressText.hpp"
#include "../common/NetworkRange.hpp"

#include <algorithm>
#include <iostream>

namespace whos_home::discovery
{
    StatusChecker::StatusChecker(CommandRunner &runner)
        : m_ranges(runner), m_probe(runner), m_macs(runner)
    {
    }

    std::vector<std::string> StatusChecker::CandidateRanges(const common::DiscoverySettings &settings)
    {
        std::vector<std::string> ranges;
        ranges.push_back(m_ranges.ResolveText(settings));

        for (const auto &fallback : RangeResolver::FallbackRanges())
        {
            if (std::find(ranges.begin(), ranges.end(), fallback) == ranges.end())
                ranges.push_back(fallback);
        }
        return ranges;
    }

    bool StatusChecker::ConfirmCachedAddress(const std::string &ip, const common::DiscoverySettings &settings)
    {
        for (common::ProbeMethod method : settings.methods)
        {
            if (m_probe.Probe(ip, method, settings).IsOnline())
                return true;
        }
        return false;
    }

    bool StatusChecker::SearchRange(const std::string &range_text, const std::string &mac,
                                    const common::DiscoverySettings &settings)
    {
        std::vector<std::string> hosts;
        try
        {
            hosts = common::NetworkRange::Parse(range_text).Hosts(TARGETED_HOSTS_PER_RANGE);
        }
        catch (const common::InvalidRangeError &e)
        {
            std::cerr << "[StatusChecker] Skipping range: " << e.what() << "\n";
            return false;
        }

        for (const auto &ip : hosts)
        {
            common::ProbeOutcome outcome = m_probe.Arping(ip, settings.arping_timeout_seconds);
            if (outcome.IsOnline() && outcome.mac_address && common::SameMac(*outcome.mac_address, mac))
                return true;
        }
        return false;
    }

    bool StatusChecker::CheckStatus(const std::string &mac, const common::DiscoverySettings &settings)
    {
        try
        {
            auto cached_ip = m_macs.ResolveIp(mac);
            if (cached_ip && ConfirmCachedAddress(*cached_ip, settings))
                return true;

            for (const auto &range : CandidateRanges(settings))
            {
                if (SearchRange(range, mac, settings))
                    return true;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[StatusChecker] Error checking device status for " << mac << ": " << e.what() << "\n";
        }
        return false;
    }
}
