#pragma once

#include <optional>
#include <string>
#include "CommandRunner.hpp"

namespace whos_home::discovery
{
    // Read-only view of the host's neighbor/ARP cache. Never generates traffic.
    class MacResolver
    {
    public:
        explicit MacResolver(CommandRunner &runner);

        std::optional<std::string> ResolveMac(const std::string &ip);

        // Inverse lookup: the IP the cache currently associates with mac.
        std::optional<std::string> ResolveIp(const std::string &mac);

        static std::optional<std::string> FindMacForIp(const std::string &table, const std::string &ip);
        static std::optional<std::string> FindIpForMac(const std::string &table, const std::string &mac);

    private:
        CommandRunner &m_runner;
    };
}
