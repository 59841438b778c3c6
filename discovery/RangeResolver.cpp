#include "RangeResolver.hpp"
#include "../common/AddressText.hpp"

#include <iostream>
#include <sstream>

namespace whos_home::discovery
{
    namespace
    {
        const std::chrono::milliseconds kRouteCommandTimeout(5000);

        const std::vector<std::vector<std::string>> kRouteCommands = {
            {"ip", "route", "show", "default"},
            {"route", "print"},
            {"netstat", "-rn"},
        };

        bool IsGatewayCandidate(const std::string &token)
        {
            return token != "0.0.0.0" && common::IsIPv4Address(token);
        }

        std::vector<std::string> Tokens(const std::string &line)
        {
            std::vector<std::string> parts;
            std::stringstream ss(line);
            std::string part;
            while (ss >> part)
                parts.push_back(part);
            return parts;
        }

        std::optional<std::string> FirstNonZeroQuad(const std::vector<std::string> &parts)
        {
            for (const auto &part : parts)
            {
                if (IsGatewayCandidate(part))
                    return part;
            }
            return std::nullopt;
        }
    }

    RangeResolver::RangeResolver(CommandRunner &runner) : m_runner(runner) {}

    const std::vector<std::string> &RangeResolver::FallbackRanges()
    {
        static const std::vector<std::string> ranges = {"192.168.1.0/24", "192.168.0.0/24", "10.0.0.0/24"};
        return ranges;
    }

    std::optional<std::string> RangeResolver::ParseGateway(const std::string &route_output)
    {
        std::stringstream ss(route_output);
        std::string line;
        while (std::getline(ss, line))
        {
            auto parts = Tokens(line);

            if (line.find("default via") != std::string::npos)
            {
                if (parts.size() >= 3 && IsGatewayCandidate(parts[2]))
                    return parts[2];
            }
            else if (line.find("0.0.0.0") != std::string::npos)
            {
                // Windows "route print": destination, netmask, gateway
                if (line.find("Gateway") == std::string::npos && parts.size() >= 3 && IsGatewayCandidate(parts[2]))
                    return parts[2];

                // netstat -rn and friends: whichever column holds the gateway
                if (auto gateway = FirstNonZeroQuad(parts))
                    return gateway;
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> RangeResolver::DetectGateway()
    {
        for (const auto &cmd : kRouteCommands)
        {
            CommandResult result = m_runner.Run(cmd, kRouteCommandTimeout);
            if (!result.Succeeded())
                continue;

            if (auto gateway = ParseGateway(result.output))
                return gateway;
        }
        return std::nullopt;
    }

    std::string RangeResolver::DetectRange()
    {
        auto gateway = DetectGateway();
        if (gateway)
        {
            try
            {
                std::string range = common::NetworkRange::ForGateway(*gateway).ToString();
                std::cout << "[RangeResolver] Auto-detected network range: " << range << "\n";
                return range;
            }
            catch (const common::InvalidRangeError &e)
            {
                std::cerr << "[RangeResolver] Could not derive range from gateway " << *gateway << ": " << e.what() << "\n";
            }
        }
        else
        {
            std::cerr << "[RangeResolver] Could not auto-detect network range: no gateway found\n";
        }

        const std::string &fallback = FallbackRanges().front();
        std::cout << "[RangeResolver] Using fallback network range: " << fallback << "\n";
        return fallback;
    }

    std::string RangeResolver::ResolveText(const common::DiscoverySettings &settings)
    {
        if (!settings.IsAutoRange())
            return settings.network_range;
        return DetectRange();
    }

    common::NetworkRange RangeResolver::Resolve(const common::DiscoverySettings &settings)
    {
        return common::NetworkRange::Parse(ResolveText(settings));
    }
}
