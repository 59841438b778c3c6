#pragma once

#include <optional>
#include <string>

// Helpers for picking addresses out of the free-form text printed by
// route, arp, ip and arping.
namespace whos_home::common
{
    bool IsIPv4Address(const std::string &text);

    // First dotted quad on the line, valid or not.
    std::optional<std::string> FindDottedQuad(const std::string &line);

    // True when ip occurs on the line as a whole token (192.168.1.1 does not match 192.168.1.10).
    bool LineMentionsIp(const std::string &line, const std::string &ip);

    // aa:bb:cc:dd:ee:ff, case-insensitive. Result is upper case.
    std::optional<std::string> FindColonMac(const std::string &line);

    // aa-bb-cc-dd-ee-ff, case-insensitive. Result is normalized to upper-case colon form.
    std::optional<std::string> FindHyphenMac(const std::string &line);

    // Token following "lladdr" in `ip neighbor` output.
    std::optional<std::string> FindLladdrMac(const std::string &line);

    // Hyphen form, then colon form, then lladdr token.
    std::optional<std::string> FindAnyMac(const std::string &line);

    // Upper-case colon form; std::nullopt if text is not a 48-bit hardware address.
    std::optional<std::string> NormalizeMac(const std::string &text);

    bool SameMac(const std::string &lhs, const std::string &rhs);
}
