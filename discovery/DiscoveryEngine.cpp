#include "DiscoveryEngine.hpp"
#include "StatusChecker.hpp"
#include "SubnetSweeper.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace whos_home::discovery
{
    DiscoveryEngine::DiscoveryEngine(std::shared_ptr<CommandRunner> runner,
                                     std::shared_ptr<HostnameResolver> hostnames,
                                     DiscoveryRecorder *recorder,
                                     common::DiscoverySettings settings)
        : m_runner(std::move(runner)), m_hostnames(std::move(hostnames)), m_recorder(recorder),
          m_observer(nullptr), m_settings(std::move(settings)), m_cancel(false)
    {
        if (!m_runner || !m_hostnames)
            throw std::invalid_argument("DiscoveryEngine requires a command runner and a hostname resolver");
    }

    common::ScanReport DiscoveryEngine::DiscoverAll(const common::DiscoverySettings &settings)
    {
        m_cancel = false;

        SubnetSweeper sweeper(*m_runner, *m_hostnames, m_recorder);
        sweeper.SetObserver(m_observer);
        return sweeper.Sweep(settings, &m_cancel);
    }

    common::ScanReport DiscoveryEngine::DiscoverAll()
    {
        return DiscoverAll(GetSettings());
    }

    bool DiscoveryEngine::CheckStatus(const std::string &mac, const common::DiscoverySettings &settings)
    {
        StatusChecker checker(*m_runner);
        return checker.CheckStatus(mac, settings);
    }

    bool DiscoveryEngine::CheckStatus(const std::string &mac)
    {
        return CheckStatus(mac, GetSettings());
    }

    void DiscoveryEngine::UpdateSettings(const common::SettingsPatch &patch)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_settings = m_settings.Merge(patch);
        std::cout << "[Engine] Settings updated (range " << m_settings.network_range << ", methods "
                  << common::FormatMethodList(m_settings.methods) << ")\n";
    }

    common::DiscoverySettings DiscoveryEngine::GetSettings() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_settings;
    }

    void DiscoveryEngine::Cancel()
    {
        m_cancel = true;
    }
}
