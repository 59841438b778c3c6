#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include "BatchRunner.hpp"
#include "CommandRunner.hpp"
#include "DiscoveryRecorder.hpp"
#include "HostnameResolver.hpp"
#include "MacResolver.hpp"
#include "RangeResolver.hpp"
#include "ReachabilityProbe.hpp"
#include "../common/DiscoverySettings.hpp"
#include "../common/DiscoveryTypes.hpp"
#include "../common/NetworkRange.hpp"

namespace whos_home::discovery
{
    class SubnetSweeper
    {
    public:
        SubnetSweeper(CommandRunner &runner, HostnameResolver &hostnames, DiscoveryRecorder *recorder = nullptr);

        void SetObserver(BatchObserver *observer) { m_observer = observer; }

        // Resolves the range from settings; throws common::InvalidRangeError for a bad explicit range.
        common::ScanReport Sweep(const common::DiscoverySettings &settings, const std::atomic<bool> *cancel = nullptr);

        common::ScanReport Sweep(const common::NetworkRange &range, const common::DiscoverySettings &settings,
                                 const std::atomic<bool> *cancel = nullptr);

        // Phase 1: one throwaway ping per host so the neighbor cache is warm for phase 2.
        void PrepopulateNeighborCache(const common::NetworkRange &range, const std::atomic<bool> *cancel = nullptr);

        // Phase 2 decision procedure for a single address.
        common::HostProbeResult EvaluateHost(const std::string &ip, const common::DiscoverySettings &settings,
                                             bool *indeterminate = nullptr);

        static constexpr std::chrono::milliseconds CACHE_SETTLE_DELAY{100};

    private:
        void Record(const common::HostProbeResult &host);

        CommandRunner &m_runner;
        HostnameResolver &m_hostnames;
        DiscoveryRecorder *m_recorder;
        BatchObserver *m_observer;

        RangeResolver m_ranges;
        ReachabilityProbe m_probe;
        MacResolver m_macs;
    };
}
