#pragma once

#include <optional>
#include <string>
#include <vector>

namespace whos_home::common
{
    enum class ProbeMethod
    {
        Ping,
        Arping
    };

    std::string ToString(ProbeMethod method);
    std::optional<ProbeMethod> ParseProbeMethod(const std::string &name);

    enum class ProbeState
    {
        Online,
        Offline,
        Indeterminate
    };

    // Internal probe verdict. Only IsOnline() leaks past the sweep and status-check boundary.
    struct ProbeOutcome
    {
        ProbeState state = ProbeState::Offline;
        std::optional<std::string> mac_address;
        std::string reason;

        bool IsOnline() const { return state == ProbeState::Online; }

        static ProbeOutcome Online(std::optional<std::string> mac = std::nullopt);
        static ProbeOutcome Offline();
        static ProbeOutcome Indeterminate(std::string reason);
    };

    struct HostProbeResult
    {
        std::string ip_address;
        std::optional<std::string> mac_address;
        std::optional<std::string> hostname;
        bool is_online = false;
        std::optional<ProbeMethod> method_used;
    };

    // Online hosts only, ascending by address.
    using ScanReport = std::vector<HostProbeResult>;

    struct DiscoveryAttempt
    {
        std::optional<std::string> mac_address;
        std::string ip_address;
        std::optional<ProbeMethod> method;
        bool success = false;
        std::string timestamp;
    };

    std::string CurrentTimestamp();
}
