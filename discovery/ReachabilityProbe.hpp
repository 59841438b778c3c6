#pragma once

#include <chrono>
#include <string>
#include "CommandRunner.hpp"
#include "../common/DiscoverySettings.hpp"
#include "../common/DiscoveryTypes.hpp"

namespace whos_home::discovery
{
    // Single-address liveness check. Every strategy shares one deadline of
    // timeout + 1s, so a probe never blocks longer than that in total.
    class ReachabilityProbe
    {
    public:
        explicit ReachabilityProbe(CommandRunner &runner);

        common::ProbeOutcome Probe(const std::string &ip, common::ProbeMethod method,
                                   const common::DiscoverySettings &settings);

        common::ProbeOutcome Ping(const std::string &ip, double timeout_seconds);
        common::ProbeOutcome Arping(const std::string &ip, double timeout_seconds);

        static std::chrono::milliseconds Budget(double timeout_seconds);

    private:
        CommandRunner &m_runner;
    };
}
