#include "MacResolver.hpp"
#include "../common/AddressText.hpp"

#include <sstream>
#include <vector>

namespace whos_home::discovery
{
    namespace
    {
        const std::chrono::milliseconds kCacheCommandTimeout(2000);

        const std::vector<std::vector<std::string>> kMacLookupCommands = {
            {"arp", "-n"},
            {"arp", "-a"},
            {"ip", "neighbor"},
        };

        const std::vector<std::vector<std::string>> kIpLookupCommands = {
            {"arp", "-n"},
            {"ip", "neighbor"},
            {"arp", "-a"},
        };
    }

    MacResolver::MacResolver(CommandRunner &runner) : m_runner(runner) {}

    std::optional<std::string> MacResolver::FindMacForIp(const std::string &table, const std::string &ip)
    {
        std::stringstream ss(table);
        std::string line;
        while (std::getline(ss, line))
        {
            if (!common::LineMentionsIp(line, ip))
                continue;

            if (auto mac = common::FindAnyMac(line))
                return mac;
        }
        return std::nullopt;
    }

    std::optional<std::string> MacResolver::FindIpForMac(const std::string &table, const std::string &mac)
    {
        std::stringstream ss(table);
        std::string line;
        while (std::getline(ss, line))
        {
            auto found = common::FindAnyMac(line);
            if (!found || !common::SameMac(*found, mac))
                continue;

            auto ip = common::FindDottedQuad(line);
            if (ip && common::IsIPv4Address(*ip))
                return ip;
        }
        return std::nullopt;
    }

    std::optional<std::string> MacResolver::ResolveMac(const std::string &ip)
    {
        for (const auto &cmd : kMacLookupCommands)
        {
            CommandResult result = m_runner.Run(cmd, kCacheCommandTimeout);
            if (!result.Succeeded())
                continue;

            if (auto mac = FindMacForIp(result.output, ip))
                return mac;
        }
        return std::nullopt;
    }

    std::optional<std::string> MacResolver::ResolveIp(const std::string &mac)
    {
        for (const auto &cmd : kIpLookupCommands)
        {
            CommandResult result = m_runner.Run(cmd, kCacheCommandTimeout);
            if (!result.Succeeded())
                continue;

            if (auto ip = FindIpForMac(result.output, mac))
                return ip;
        }
        return std::nullopt;
    }
}
