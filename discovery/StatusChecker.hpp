#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "CommandRunner.hpp"
#include "MacResolver.hpp"
#include "RangeResolver.hpp"
#include "ReachabilityProbe.hpp"
#include "../common/DiscoverySettings.hpp"

namespace whos_home::discovery
{
    inline constexpr std::size_t TARGETED_HOSTS_PER_RANGE = 50;

    // Cheap "is this known device here" check: cached IP first, then the first
    // few addresses of a handful of likely ranges. Never throws for network conditions.
    class StatusChecker
    {
    public:
        explicit StatusChecker(CommandRunner &runner);

        bool CheckStatus(const std::string &mac, const common::DiscoverySettings &settings);

        // Configured range (or auto-detected one) followed by the common private ranges, duplicates removed.
        std::vector<std::string> CandidateRanges(const common::DiscoverySettings &settings);

    private:
        bool ConfirmCachedAddress(const std::string &ip, const common::DiscoverySettings &settings);
        bool SearchRange(const std::string &range_text, const std::string &mac, const common::DiscoverySettings &settings);

        RangeResolver m_ranges;
        ReachabilityProbe m_probe;
        MacResolver m_macs;
    };
}
