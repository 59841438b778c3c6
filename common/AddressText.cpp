#include "AddressText.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <regex>
#include <sstream>
#include <tins/tins.h>

namespace whos_home::common
{
    namespace
    {
        const std::regex kColonMac("([0-9a-f]{2}:[0-9a-f]{2}:[0-9a-f]{2}:[0-9a-f]{2}:[0-9a-f]{2}:[0-9a-f]{2})");
        const std::regex kHyphenMac("([0-9a-f]{2}-[0-9a-f]{2}-[0-9a-f]{2}-[0-9a-f]{2}-[0-9a-f]{2}-[0-9a-f]{2})");
        const std::regex kExactColonMac("^[0-9a-f]{2}(:[0-9a-f]{2}){5}$");
        const std::regex kDottedQuad("(\\d+\\.\\d+\\.\\d+\\.\\d+)");

        std::string Lower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        std::string Upper(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            return text;
        }

        bool IsAddressChar(char c)
        {
            return std::isdigit(static_cast<unsigned char>(c)) || c == '.';
        }
    }

    bool IsIPv4Address(const std::string &text)
    {
        in_addr addr{};
        return inet_pton(AF_INET, text.c_str(), &addr) == 1;
    }

    std::optional<std::string> FindDottedQuad(const std::string &line)
    {
        std::smatch match;
        if (std::regex_search(line, match, kDottedQuad))
            return match[1].str();
        return std::nullopt;
    }

    bool LineMentionsIp(const std::string &line, const std::string &ip)
    {
        if (ip.empty())
            return false;

        size_t pos = line.find(ip);
        while (pos != std::string::npos)
        {
            bool left_ok = (pos == 0) || !IsAddressChar(line[pos - 1]);
            size_t end = pos + ip.size();
            bool right_ok = (end >= line.size()) || !IsAddressChar(line[end]);
            if (left_ok && right_ok)
                return true;
            pos = line.find(ip, pos + 1);
        }
        return false;
    }

    std::optional<std::string> FindColonMac(const std::string &line)
    {
        std::string lowered = Lower(line);
        std::smatch match;
        if (std::regex_search(lowered, match, kColonMac))
            return NormalizeMac(match[1].str());
        return std::nullopt;
    }

    std::optional<std::string> FindHyphenMac(const std::string &line)
    {
        std::string lowered = Lower(line);
        std::smatch match;
        if (std::regex_search(lowered, match, kHyphenMac))
            return NormalizeMac(match[1].str());
        return std::nullopt;
    }

    std::optional<std::string> FindLladdrMac(const std::string &line)
    {
        std::stringstream ss(line);
        std::string token;
        while (ss >> token)
        {
            if (token != "lladdr")
                continue;

            std::string candidate;
            if (ss >> candidate && std::regex_match(Lower(candidate), kExactColonMac))
                return NormalizeMac(candidate);
            return std::nullopt;
        }
        return std::nullopt;
    }

    std::optional<std::string> FindAnyMac(const std::string &line)
    {
        if (auto mac = FindHyphenMac(line))
            return mac;
        if (auto mac = FindColonMac(line))
            return mac;
        return FindLladdrMac(line);
    }

    std::optional<std::string> NormalizeMac(const std::string &text)
    {
        std::string colon = Lower(text);
        std::replace(colon.begin(), colon.end(), '-', ':');
        if (!std::regex_match(colon, kExactColonMac))
            return std::nullopt;

        try
        {
            Tins::HWAddress<6> hw(colon);
            return Upper(hw.to_string());
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

    bool SameMac(const std::string &lhs, const std::string &rhs)
    {
        auto a = NormalizeMac(lhs);
        auto b = NormalizeMac(rhs);
        if (a && b)
            return *a == *b;
        return Upper(lhs) == Upper(rhs);
    }
}
