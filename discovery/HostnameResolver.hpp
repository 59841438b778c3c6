#pragma once

#include <optional>
#include <string>

namespace whos_home::discovery
{
    class HostnameResolver
    {
    public:
        virtual ~HostnameResolver() = default;
        virtual std::optional<std::string> Lookup(const std::string &ip) = 0;
    };

    // Reverse DNS through getnameinfo; any failure yields no hostname.
    class SystemHostnameResolver : public HostnameResolver
    {
    public:
        std::optional<std::string> Lookup(const std::string &ip) override;
    };
}
