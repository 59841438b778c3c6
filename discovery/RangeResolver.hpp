#pragma once

#include <optional>
#include <string>
#include <vector>
#include "CommandRunner.hpp"
#include "../common/DiscoverySettings.hpp"
#include "../common/NetworkRange.hpp"

namespace whos_home::discovery
{
    class RangeResolver
    {
    public:
        explicit RangeResolver(CommandRunner &runner);

        // Explicit settings are returned untouched; "auto" always yields a parsable range.
        std::string ResolveText(const common::DiscoverySettings &settings);

        // Throws common::InvalidRangeError when an explicit range does not parse.
        common::NetworkRange Resolve(const common::DiscoverySettings &settings);

        std::optional<std::string> DetectGateway();

        static std::optional<std::string> ParseGateway(const std::string &route_output);

        static const std::vector<std::string> &FallbackRanges();

    private:
        std::string DetectRange();

        CommandRunner &m_runner;
    };
}
