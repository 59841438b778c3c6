#include "SubnetSweeper.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

namespace whos_home::discovery
{
    namespace
    {
        const std::chrono::milliseconds kPrepopulateTimeout(2000);

        // Appended to from every unit thread; handed back in range order.
        class ResultCollector
        {
        public:
            void Add(std::size_t index, common::HostProbeResult result)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_entries.emplace_back(index, std::move(result));
            }

            common::ScanReport Take()
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                std::sort(m_entries.begin(), m_entries.end(),
                          [](const auto &a, const auto &b)
                          { return a.first < b.first; });

                common::ScanReport report;
                report.reserve(m_entries.size());
                for (auto &entry : m_entries)
                    report.push_back(std::move(entry.second));
                m_entries.clear();
                return report;
            }

        private:
            std::mutex m_mutex;
            std::vector<std::pair<std::size_t, common::HostProbeResult>> m_entries;
        };
    }

    SubnetSweeper::SubnetSweeper(CommandRunner &runner, HostnameResolver &hostnames, DiscoveryRecorder *recorder)
        : m_runner(runner), m_hostnames(hostnames), m_recorder(recorder), m_observer(nullptr),
          m_ranges(runner), m_probe(runner), m_macs(runner)
    {
    }

    common::ScanReport SubnetSweeper::Sweep(const common::DiscoverySettings &settings, const std::atomic<bool> *cancel)
    {
        common::NetworkRange range = m_ranges.Resolve(settings);
        return Sweep(range, settings, cancel);
    }

    common::ScanReport SubnetSweeper::Sweep(const common::NetworkRange &range, const common::DiscoverySettings &settings,
                                            const std::atomic<bool> *cancel)
    {
        std::cout << "[Sweeper] Scanning network range: " << range.ToString() << "\n";

        // Addresses are derived per unit; a wide range is never materialized.
        PrepopulateNeighborCache(range, cancel);

        ResultCollector collector;
        std::atomic<std::size_t> indeterminate(0);

        BatchRunner runner;
        runner.SetObserver(m_observer);
        runner.Run(
            static_cast<std::size_t>(range.HostCount()),
            [&](std::size_t index)
            {
                bool unresolved = false;
                common::HostProbeResult host = EvaluateHost(range.HostAt(index), settings, &unresolved);
                if (unresolved)
                    ++indeterminate;
                if (host.is_online)
                    collector.Add(index, std::move(host));
            },
            cancel);

        common::ScanReport report = collector.Take();
        std::cout << "[Sweeper] Network scan completed. Found " << report.size() << " devices ("
                  << indeterminate.load() << " indeterminate)\n";
        return report;
    }

    void SubnetSweeper::PrepopulateNeighborCache(const common::NetworkRange &range, const std::atomic<bool> *cancel)
    {
        std::cout << "[Sweeper] Pre-populating ARP table...\n";

        BatchRunner runner;
        runner.SetObserver(m_observer);
        runner.Run(
            static_cast<std::size_t>(range.HostCount()),
            [&](std::size_t index)
            {
                const std::string ip = range.HostAt(index);
                CommandResult result = m_runner.Run({"ping", "-c", "1", "-W", "1", ip}, kPrepopulateTimeout);
                if (result.status == CommandStatus::NotFound)
                    m_runner.Run({"ping", "-n", "1", "-w", "100", ip}, kPrepopulateTimeout);
            },
            cancel);

        std::cout << "[Sweeper] ARP table population completed\n";
    }

    common::HostProbeResult SubnetSweeper::EvaluateHost(const std::string &ip, const common::DiscoverySettings &settings,
                                                        bool *indeterminate)
    {
        common::HostProbeResult host;
        host.ip_address = ip;

        bool any_indeterminate = false;
        for (common::ProbeMethod method : settings.methods)
        {
            common::ProbeOutcome outcome = m_probe.Probe(ip, method, settings);
            if (outcome.IsOnline())
            {
                host.is_online = true;
                host.method_used = method;
                host.mac_address = outcome.mac_address;
                break;
            }
            if (outcome.state == common::ProbeState::Indeterminate)
                any_indeterminate = true;
        }

        if (indeterminate)
            *indeterminate = !host.is_online && any_indeterminate;

        if (!host.is_online)
            return host;

        if (!host.mac_address)
        {
            if (host.method_used == common::ProbeMethod::Ping)
                host.mac_address = m_probe.Arping(ip, settings.arping_timeout_seconds).mac_address;

            if (!host.mac_address)
            {
                std::this_thread::sleep_for(CACHE_SETTLE_DELAY);
                host.mac_address = m_macs.ResolveMac(ip);
            }
        }

        host.hostname = m_hostnames.Lookup(ip);

        Record(host);
        return host;
    }

    void SubnetSweeper::Record(const common::HostProbeResult &host)
    {
        if (!m_recorder)
            return;

        common::DiscoveryAttempt attempt;
        attempt.mac_address = host.mac_address;
        attempt.ip_address = host.ip_address;
        attempt.method = host.method_used;
        attempt.success = host.is_online;
        attempt.timestamp = common::CurrentTimestamp();

        try
        {
            m_recorder->RecordAttempt(attempt);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Sweeper] Failed to record discovery of " << host.ip_address << ": " << e.what() << "\n";
        }
    }
}
