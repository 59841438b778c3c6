#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include "BatchRunner.hpp"
#include "CommandRunner.hpp"
#include "DiscoveryRecorder.hpp"
#include "HostnameResolver.hpp"
#include "../common/DiscoverySettings.hpp"
#include "../common/DiscoveryTypes.hpp"

namespace whos_home::discovery
{
    // Caller-facing entry points. Every operation works on an explicit settings
    // snapshot; the stored snapshot is only a convenience for callers that
    // re-inject configuration between operations.
    class DiscoveryEngine
    {
    public:
        DiscoveryEngine(std::shared_ptr<CommandRunner> runner,
                        std::shared_ptr<HostnameResolver> hostnames,
                        DiscoveryRecorder *recorder = nullptr,
                        common::DiscoverySettings settings = {});

        DiscoveryEngine(const DiscoveryEngine &) = delete;
        DiscoveryEngine &operator=(const DiscoveryEngine &) = delete;

        // Throws common::InvalidRangeError for a malformed explicit range.
        common::ScanReport DiscoverAll(const common::DiscoverySettings &settings);
        common::ScanReport DiscoverAll();

        bool CheckStatus(const std::string &mac, const common::DiscoverySettings &settings);
        bool CheckStatus(const std::string &mac);

        void UpdateSettings(const common::SettingsPatch &patch);
        common::DiscoverySettings GetSettings() const;

        // Stops an in-progress sweep at its next batch boundary.
        void Cancel();

        void SetObserver(BatchObserver *observer) { m_observer = observer; }

    private:
        std::shared_ptr<CommandRunner> m_runner;
        std::shared_ptr<HostnameResolver> m_hostnames;
        DiscoveryRecorder *m_recorder;
        BatchObserver *m_observer;

        common::DiscoverySettings m_settings;
        mutable std::mutex m_mutex;

        std::atomic<bool> m_cancel;
    };
}
