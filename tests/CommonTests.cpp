#include <gtest/gtest.h>
#include "../common/AddressText.hpp"
#include "../common/DiscoverySettings.hpp"
#include "../common/NetworkRange.hpp"

using namespace whos_home::common;

TEST(NetworkRangeTest, ParsesCidr)
{
    NetworkRange range = NetworkRange::Parse("192.168.1.0/24");
    EXPECT_EQ(range.ToString(), "192.168.1.0/24");
    EXPECT_EQ(range.PrefixLength(), 24u);
    EXPECT_EQ(range.HostCount(), 254u);
}

TEST(NetworkRangeTest, MasksHostBits)
{
    EXPECT_EQ(NetworkRange::Parse("192.168.1.77/24").ToString(), "192.168.1.0/24");
    EXPECT_EQ(NetworkRange::Parse("10.1.2.3/8").ToString(), "10.0.0.0/8");
}

TEST(NetworkRangeTest, BareAddressIsSingleHost)
{
    NetworkRange range = NetworkRange::Parse("10.0.0.5");
    EXPECT_EQ(range.PrefixLength(), 32u);
    EXPECT_EQ(range.Hosts(), std::vector<std::string>{"10.0.0.5"});
}

TEST(NetworkRangeTest, RejectsMalformedRanges)
{
    for (const char *bad : {"not-a-cidr", "", "192.168.1.0/33", "192.168.1.0/", "300.1.1.1/24",
                            "192.168.1.0/2a", "192.168.1/24", "192.168.1.0/024"})
    {
        EXPECT_THROW(NetworkRange::Parse(bad), InvalidRangeError) << bad;
    }
}

TEST(NetworkRangeTest, ErrorCarriesOffendingText)
{
    try
    {
        NetworkRange::Parse("not-a-cidr");
        FAIL() << "expected InvalidRangeError";
    }
    catch (const InvalidRangeError &e)
    {
        EXPECT_EQ(e.Range(), "not-a-cidr");
        EXPECT_STREQ(e.what(), "Invalid network range: 'not-a-cidr'");
    }
}

TEST(NetworkRangeTest, HostsExcludeNetworkAndBroadcast)
{
    auto hosts = NetworkRange::Parse("192.168.1.0/24").Hosts();
    ASSERT_EQ(hosts.size(), 254u);
    EXPECT_EQ(hosts.front(), "192.168.1.1");
    EXPECT_EQ(hosts.back(), "192.168.1.254");

    EXPECT_EQ(NetworkRange::Parse("203.0.113.0/30").Hosts(),
              (std::vector<std::string>{"203.0.113.1", "203.0.113.2"}));
}

TEST(NetworkRangeTest, PointToPointKeepsBothEnds)
{
    EXPECT_EQ(NetworkRange::Parse("203.0.113.4/31").Hosts(),
              (std::vector<std::string>{"203.0.113.4", "203.0.113.5"}));
}

TEST(NetworkRangeTest, HostsHonourLimitAndCrossOctets)
{
    auto first = NetworkRange::Parse("10.0.0.0/16").Hosts(50);
    ASSERT_EQ(first.size(), 50u);
    EXPECT_EQ(first.front(), "10.0.0.1");
    EXPECT_EQ(first.back(), "10.0.0.50");

    auto all = NetworkRange::Parse("10.0.0.0/23").Hosts();
    ASSERT_EQ(all.size(), 510u);
    EXPECT_EQ(all[254], "10.0.0.255");
    EXPECT_EQ(all[255], "10.0.1.0");
}

TEST(NetworkRangeTest, HostAtIndexesWithoutEnumerating)
{
    auto lan = NetworkRange::Parse("192.168.1.0/24");
    EXPECT_EQ(lan.HostAt(0), "192.168.1.1");
    EXPECT_EQ(lan.HostAt(253), "192.168.1.254");
    EXPECT_THROW(lan.HostAt(254), std::out_of_range);

    EXPECT_EQ(NetworkRange::Parse("203.0.113.4/31").HostAt(1), "203.0.113.5");
    EXPECT_EQ(NetworkRange::Parse("10.0.0.5/32").HostAt(0), "10.0.0.5");

    auto everything = NetworkRange::Parse("0.0.0.0/0");
    EXPECT_EQ(everything.HostCount(), 4294967294u);
    EXPECT_EQ(everything.HostAt(0), "0.0.0.1");
    EXPECT_EQ(everything.HostAt(everything.HostCount() - 1), "255.255.255.254");
    EXPECT_EQ(everything.Hosts(3), (std::vector<std::string>{"0.0.0.1", "0.0.0.2", "0.0.0.3"}));
}

TEST(NetworkRangeTest, GatewayMapsToItsSlash24)
{
    EXPECT_EQ(NetworkRange::ForGateway("192.168.7.1"), NetworkRange::Parse("192.168.7.0/24"));
}

TEST(AddressTextTest, IpMatchIsWholeToken)
{
    const std::string line = "? (192.168.1.10) at aa:bb:cc:dd:ee:ff [ether] on eth0";
    EXPECT_FALSE(LineMentionsIp(line, "192.168.1.1"));
    EXPECT_TRUE(LineMentionsIp(line, "192.168.1.10"));
    EXPECT_FALSE(LineMentionsIp("10.192.168.1.1 x", "192.168.1.1"));
    EXPECT_TRUE(LineMentionsIp("192.168.1.1 dev eth0", "192.168.1.1"));
}

TEST(AddressTextTest, FindsMacsInEveryToolFormat)
{
    EXPECT_EQ(FindColonMac("? (192.168.1.5) at aa:bb:cc:dd:ee:0f [ether] on eth0"), "AA:BB:CC:DD:EE:0F");
    EXPECT_EQ(FindHyphenMac("  192.168.1.1          00-1a-2b-3c-4d-5e     dynamic"), "00:1A:2B:3C:4D:5E");
    EXPECT_EQ(FindLladdrMac("192.168.1.1 dev eth0 lladdr 00:1a:2b:3c:4d:5e REACHABLE"), "00:1A:2B:3C:4D:5E");
    EXPECT_EQ(FindAnyMac("192.168.1.1 dev eth0 lladdr 00:1a:2b:3c:4d:5e STALE"), "00:1A:2B:3C:4D:5E");
    EXPECT_FALSE(FindAnyMac("192.168.1.9 dev eth0 FAILED").has_value());
}

TEST(AddressTextTest, NormalizesAndComparesMacs)
{
    EXPECT_EQ(NormalizeMac("aa-bb-cc-dd-ee-ff"), "AA:BB:CC:DD:EE:FF");
    EXPECT_FALSE(NormalizeMac("zz:bb:cc:dd:ee:ff").has_value());
    EXPECT_FALSE(NormalizeMac("aa:bb:cc:dd:ee").has_value());
    EXPECT_TRUE(SameMac("aa-bb-cc-dd-ee-ff", "AA:BB:CC:DD:EE:FF"));
    EXPECT_FALSE(SameMac("aa:bb:cc:dd:ee:fe", "AA:BB:CC:DD:EE:FF"));
}

TEST(AddressTextTest, ValidatesDottedQuads)
{
    EXPECT_TRUE(IsIPv4Address("192.168.1.1"));
    EXPECT_FALSE(IsIPv4Address("256.1.1.1"));
    EXPECT_FALSE(IsIPv4Address("Gateway"));
    EXPECT_EQ(FindDottedQuad("default via 192.168.1.1 dev eth0"), "192.168.1.1");
}

TEST(DiscoverySettingsTest, Defaults)
{
    DiscoverySettings settings;
    EXPECT_EQ(settings.methods, (std::vector<ProbeMethod>{ProbeMethod::Ping, ProbeMethod::Arping}));
    EXPECT_TRUE(settings.IsAutoRange());
    EXPECT_DOUBLE_EQ(settings.ping_timeout_seconds, 1);
    EXPECT_DOUBLE_EQ(settings.arping_timeout_seconds, 2);
    EXPECT_EQ(settings.scan_interval_seconds, 30);
}

TEST(DiscoverySettingsTest, UnknownMethodsAreDropped)
{
    SettingsPatch patch = SettingsPatch::FromKeyValues({{"discovery_methods", "[\"arping\", \"bogus\"]"}});
    ASSERT_TRUE(patch.methods.has_value());
    EXPECT_EQ(*patch.methods, std::vector<ProbeMethod>{ProbeMethod::Arping});

    EXPECT_EQ(ParseMethodList("ping,ARPING"), (std::vector<ProbeMethod>{ProbeMethod::Ping, ProbeMethod::Arping}));
}

TEST(DiscoverySettingsTest, BadTimeoutsAreSkipped)
{
    SettingsPatch patch = SettingsPatch::FromKeyValues({{"ping_timeout", "abc"}, {"arping_timeout", "-1"}});
    EXPECT_FALSE(patch.ping_timeout_seconds.has_value());
    EXPECT_FALSE(patch.arping_timeout_seconds.has_value());

    patch = SettingsPatch::FromKeyValues({{"ping_timeout", "0.5"}, {"unrelated", "x"}});
    ASSERT_TRUE(patch.ping_timeout_seconds.has_value());
    EXPECT_DOUBLE_EQ(*patch.ping_timeout_seconds, 0.5);
}

TEST(DiscoverySettingsTest, OversizedDurationsAreSkipped)
{
    SettingsPatch patch = SettingsPatch::FromKeyValues(
        {{"ping_timeout", "1e10"}, {"arping_timeout", "3601"}, {"scan_interval", "1e12"}});
    EXPECT_FALSE(patch.ping_timeout_seconds.has_value());
    EXPECT_FALSE(patch.arping_timeout_seconds.has_value());
    EXPECT_FALSE(patch.scan_interval_seconds.has_value());

    patch = SettingsPatch::FromKeyValues({{"ping_timeout", "3600"}, {"scan_interval", "86400"}});
    EXPECT_EQ(patch.ping_timeout_seconds, MAX_TIMEOUT_SECONDS);
    EXPECT_EQ(patch.scan_interval_seconds, MAX_SCAN_INTERVAL_SECONDS);
}

TEST(DiscoverySettingsTest, PositiveIntegersOnly)
{
    EXPECT_EQ(ParsePositiveInt("25", 1000), 25);
    EXPECT_EQ(ParsePositiveInt(" 7 ", 1000), 7);
    EXPECT_FALSE(ParsePositiveInt("abc", 1000).has_value());
    EXPECT_FALSE(ParsePositiveInt("-1", 1000).has_value());
    EXPECT_FALSE(ParsePositiveInt("0", 1000).has_value());
    EXPECT_FALSE(ParsePositiveInt("12x", 1000).has_value());
    EXPECT_FALSE(ParsePositiveInt("1001", 1000).has_value());
    EXPECT_FALSE(ParsePositiveInt("99999999999", 1000).has_value());
}

TEST(DiscoverySettingsTest, MergeTouchesOnlyPatchedFields)
{
    SettingsPatch patch;
    patch.network_range = "10.0.0.0/24";

    DiscoverySettings base;
    DiscoverySettings merged = base.Merge(patch);
    EXPECT_EQ(merged.network_range, "10.0.0.0/24");
    EXPECT_EQ(merged.methods, base.methods);
    EXPECT_DOUBLE_EQ(merged.arping_timeout_seconds, base.arping_timeout_seconds);
    EXPECT_TRUE(base.IsAutoRange());
}

TEST(DiscoverySettingsTest, KeyValueRendering)
{
    auto values = DiscoverySettings{}.ToKeyValues();
    EXPECT_EQ(values.at("discovery_methods"), "[\"ping\", \"arping\"]");
    EXPECT_EQ(values.at("network_range"), "auto");
    EXPECT_EQ(values.at("ping_timeout"), "1");
    EXPECT_EQ(values.at("arping_timeout"), "2");
    EXPECT_EQ(values.at("scan_interval"), "30");

    DiscoverySettings reparsed = DiscoverySettings{}.Merge(SettingsPatch::FromKeyValues(values));
    EXPECT_EQ(reparsed.methods, DiscoverySettings{}.methods);
}
