#include "ReachabilityProbe.hpp"
#include "MacResolver.hpp"
#include "../common/AddressText.hpp"

#include <algorithm>
#include <sstream>

namespace whos_home::discovery
{
    namespace
    {
        using Clock = std::chrono::steady_clock;

        std::chrono::milliseconds Remaining(Clock::time_point deadline)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            return std::max(left, std::chrono::milliseconds(0));
        }

        // Timeouts are clamped to MAX_TIMEOUT_SECONDS so deadline arithmetic cannot overflow.
        double ClampTimeout(double seconds)
        {
            if (!(seconds > 0))
                return 0;
            return std::min(seconds, common::MAX_TIMEOUT_SECONDS);
        }

        std::chrono::milliseconds SecondsToMillis(double seconds)
        {
            return std::chrono::milliseconds(static_cast<long long>(ClampTimeout(seconds) * 1000));
        }

        std::optional<std::string> FirstColonMac(const std::string &output)
        {
            std::stringstream ss(output);
            std::string line;
            while (std::getline(ss, line))
            {
                if (auto mac = common::FindColonMac(line))
                    return mac;
            }
            return std::nullopt;
        }
    }

    ReachabilityProbe::ReachabilityProbe(CommandRunner &runner) : m_runner(runner) {}

    std::chrono::milliseconds ReachabilityProbe::Budget(double timeout_seconds)
    {
        return SecondsToMillis(ClampTimeout(timeout_seconds)) + std::chrono::seconds(1);
    }

    common::ProbeOutcome ReachabilityProbe::Probe(const std::string &ip, common::ProbeMethod method,
                                                  const common::DiscoverySettings &settings)
    {
        switch (method)
        {
        case common::ProbeMethod::Ping:
            return Ping(ip, settings.ping_timeout_seconds);
        case common::ProbeMethod::Arping:
            return Arping(ip, settings.arping_timeout_seconds);
        }
        return common::ProbeOutcome::Indeterminate("unsupported method");
    }

    common::ProbeOutcome ReachabilityProbe::Ping(const std::string &ip, double timeout_seconds)
    {
        timeout_seconds = ClampTimeout(timeout_seconds);
        const auto deadline = Clock::now() + Budget(timeout_seconds);

        // Both argument forms are tried regardless of platform.
        const std::vector<std::vector<std::string>> forms = {
            {"ping", "-c", "1", "-W", common::FormatSeconds(timeout_seconds), ip},
            {"ping", "-n", "1", "-w", std::to_string(static_cast<long long>(timeout_seconds * 1000)), ip},
        };

        bool launched = false;
        bool timed_out = false;

        for (const auto &cmd : forms)
        {
            auto remaining = Remaining(deadline);
            if (remaining.count() == 0)
            {
                timed_out = true;
                break;
            }

            CommandResult result = m_runner.Run(cmd, remaining);
            if (result.Succeeded())
                return common::ProbeOutcome::Online();

            launched = launched || result.Launched();
            timed_out = timed_out || result.status == CommandStatus::TimedOut;
        }

        if (timed_out)
            return common::ProbeOutcome::Indeterminate("ping timed out");
        if (!launched)
            return common::ProbeOutcome::Indeterminate("ping unavailable");
        return common::ProbeOutcome::Offline();
    }

    common::ProbeOutcome ReachabilityProbe::Arping(const std::string &ip, double timeout_seconds)
    {
        timeout_seconds = ClampTimeout(timeout_seconds);
        const auto deadline = Clock::now() + Budget(timeout_seconds);

        CommandResult arping = m_runner.Run({"arping", "-c", "1", "-w", common::FormatSeconds(timeout_seconds), ip},
                                            Remaining(deadline));
        if (arping.Succeeded())
            return common::ProbeOutcome::Online(FirstColonMac(arping.output));

        if (arping.status == CommandStatus::TimedOut)
            return common::ProbeOutcome::Indeterminate("arping timed out");

        // No arping, or no reply: see whether the neighbor table knows the address.
        bool launched = arping.Launched();
        const std::vector<std::vector<std::string>> fallbacks = {
            {"arp", "-a", ip},
            {"arp", "-n", ip},
        };

        for (const auto &cmd : fallbacks)
        {
            auto budget = std::min(Remaining(deadline), SecondsToMillis(timeout_seconds));
            if (budget.count() == 0)
                return common::ProbeOutcome::Indeterminate("arping budget exhausted");

            CommandResult result = m_runner.Run(cmd, budget);
            launched = launched || result.Launched();
            if (!result.Succeeded())
                continue;

            if (auto mac = MacResolver::FindMacForIp(result.output, ip))
                return common::ProbeOutcome::Online(mac);
        }

        if (!launched)
            return common::ProbeOutcome::Indeterminate("no link-layer tool available");
        return common::ProbeOutcome::Offline();
    }
}
