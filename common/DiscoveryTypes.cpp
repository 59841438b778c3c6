#include "DiscoveryTypes.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace whos_home::common
{
    std::string ToString(ProbeMethod method)
    {
        switch (method)
        {
        case ProbeMethod::Ping:
            return "ping";
        case ProbeMethod::Arping:
            return "arping";
        }
        return "unknown";
    }

    std::optional<ProbeMethod> ParseProbeMethod(const std::string &name)
    {
        std::string lowered = name;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (lowered == "ping")
            return ProbeMethod::Ping;
        if (lowered == "arping")
            return ProbeMethod::Arping;
        return std::nullopt;
    }

    ProbeOutcome ProbeOutcome::Online(std::optional<std::string> mac)
    {
        ProbeOutcome outcome;
        outcome.state = ProbeState::Online;
        outcome.mac_address = std::move(mac);
        return outcome;
    }

    ProbeOutcome ProbeOutcome::Offline()
    {
        return ProbeOutcome{};
    }

    ProbeOutcome ProbeOutcome::Indeterminate(std::string reason)
    {
        ProbeOutcome outcome;
        outcome.state = ProbeState::Indeterminate;
        outcome.reason = std::move(reason);
        return outcome;
    }

    std::string CurrentTimestamp()
    {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
        return ss.str();
    }
}
