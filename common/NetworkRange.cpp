#include "NetworkRange.hpp"
#include "AddressText.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>

namespace whos_home::common
{
    namespace
    {
        bool ToHostOrder(const std::string &ip, uint32_t &value_out)
        {
            in_addr addr{};
            if (inet_pton(AF_INET, ip.c_str(), &addr) != 1)
                return false;
            value_out = ntohl(addr.s_addr);
            return true;
        }

        std::string FromHostOrder(uint32_t value)
        {
            in_addr addr{};
            addr.s_addr = htonl(value);
            char buffer[INET_ADDRSTRLEN];
            if (!inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)))
                return "";
            return buffer;
        }
    }

    NetworkRange::NetworkRange(Tins::IPv4Address network, uint32_t prefix)
        : m_network(network), m_prefix(prefix)
    {
    }

    NetworkRange NetworkRange::Parse(const std::string &cidr)
    {
        auto slash = cidr.find('/');
        std::string address_text = (slash == std::string::npos) ? cidr : cidr.substr(0, slash);

        uint32_t prefix = 32;
        if (slash != std::string::npos)
        {
            std::string prefix_text = cidr.substr(slash + 1);
            if (prefix_text.empty() || prefix_text.size() > 2)
                throw InvalidRangeError(cidr);
            for (char c : prefix_text)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    throw InvalidRangeError(cidr);
            }
            prefix = static_cast<uint32_t>(std::stoul(prefix_text));
            if (prefix > 32)
                throw InvalidRangeError(cidr);
        }

        if (!IsIPv4Address(address_text))
            throw InvalidRangeError(cidr);

        try
        {
            Tins::IPv4Address address(address_text);
            Tins::IPv4Address network = address & Tins::IPv4Address::from_prefix_length(prefix);
            return NetworkRange(network, prefix);
        }
        catch (const std::exception &)
        {
            throw InvalidRangeError(cidr);
        }
    }

    NetworkRange NetworkRange::ForGateway(const std::string &gateway)
    {
        return Parse(gateway + "/24");
    }

    std::string NetworkRange::ToString() const
    {
        return m_network.to_string() + "/" + std::to_string(m_prefix);
    }

    std::uint64_t NetworkRange::HostCount() const
    {
        std::uint64_t size = std::uint64_t{1} << (32 - m_prefix);
        return m_prefix <= 30 ? size - 2 : size;
    }

    std::string NetworkRange::HostAt(std::uint64_t index) const
    {
        if (index >= HostCount())
            throw std::out_of_range("Host index " + std::to_string(index) + " outside " + ToString());

        uint32_t base = 0;
        if (!ToHostOrder(m_network.to_string(), base))
            throw std::out_of_range("Unusable network address in " + ToString());

        std::uint64_t first = m_prefix <= 30 ? std::uint64_t{base} + 1 : base;
        return FromHostOrder(static_cast<uint32_t>(first + index));
    }

    std::vector<std::string> NetworkRange::Hosts(std::size_t limit) const
    {
        std::vector<std::string> hosts;
        const std::uint64_t count = std::min<std::uint64_t>(HostCount(), limit);
        hosts.reserve(static_cast<std::size_t>(count));
        for (std::uint64_t index = 0; index < count; ++index)
            hosts.push_back(HostAt(index));
        return hosts;
    }
}
