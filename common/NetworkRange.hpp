#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include <tins/tins.h>

namespace whos_home::common
{
    class InvalidRangeError : public std::runtime_error
    {
    public:
        explicit InvalidRangeError(const std::string &range)
            : std::runtime_error("Invalid network range: '" + range + "'"), m_range(range) {}

        const std::string &Range() const { return m_range; }

    private:
        std::string m_range;
    };

    // A resolved IPv4 CIDR block. Host bits of the parsed address are masked off.
    class NetworkRange
    {
    public:
        static NetworkRange Parse(const std::string &cidr);

        // /24 containing the gateway, e.g. 192.168.7.1 -> 192.168.7.0/24
        static NetworkRange ForGateway(const std::string &gateway);

        const Tins::IPv4Address &Network() const { return m_network; }
        uint32_t PrefixLength() const { return m_prefix; }
        std::string ToString() const;

        // Usable host addresses in ascending order. Network and broadcast addresses
        // are excluded up to /30; a /31 yields both ends and a /32 its single address.
        std::vector<std::string> Hosts(std::size_t limit = std::numeric_limits<std::size_t>::max()) const;
        std::uint64_t HostCount() const;

        // The index-th usable host, without enumerating the others.
        // Throws std::out_of_range when index >= HostCount().
        std::string HostAt(std::uint64_t index) const;

        bool operator==(const NetworkRange &other) const
        {
            return m_network == other.m_network && m_prefix == other.m_prefix;
        }

    private:
        NetworkRange(Tins::IPv4Address network, uint32_t prefix);

        Tins::IPv4Address m_network;
        uint32_t m_prefix;
    };
}
