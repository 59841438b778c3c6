#include <gtest/gtest.h>
#include "FakeCommandRunner.hpp"
#include "../discovery/MacResolver.hpp"
#include "../discovery/RangeResolver.hpp"

using namespace whos_home;
using discovery::CommandResult;
using whos_home::fakes::FakeCommandRunner;

namespace
{
    common::DiscoverySettings WithRange(const std::string &range)
    {
        common::DiscoverySettings settings;
        settings.network_range = range;
        return settings;
    }
}

TEST(RangeResolverTest, MalformedExplicitRangeThrowsWithoutAutoDetection)
{
    FakeCommandRunner runner([](const std::string &, std::chrono::milliseconds)
                             { return CommandResult::Exit(0, "default via 192.168.7.1 dev eth0"); });
    discovery::RangeResolver resolver(runner);

    EXPECT_THROW(resolver.Resolve(WithRange("not-a-cidr")), common::InvalidRangeError);
    EXPECT_TRUE(runner.Calls().empty());
}

TEST(RangeResolverTest, ExplicitRangeIsUsedVerbatim)
{
    FakeCommandRunner runner;
    discovery::RangeResolver resolver(runner);

    EXPECT_EQ(resolver.ResolveText(WithRange("10.20.0.0/16")), "10.20.0.0/16");
    EXPECT_EQ(resolver.Resolve(WithRange("10.20.0.0/16")).ToString(), "10.20.0.0/16");
    EXPECT_TRUE(runner.Calls().empty());
}

TEST(RangeResolverTest, AutoUsesDefaultRouteGateway)
{
    FakeCommandRunner runner([](const std::string &cmd, std::chrono::milliseconds)
                             {
                                 if (cmd == "ip route show default")
                                     return CommandResult::Exit(0, "default via 192.168.7.1 dev eth0 proto dhcp metric 100\n");
                                 return CommandResult::Missing();
                             });
    discovery::RangeResolver resolver(runner);

    EXPECT_EQ(resolver.ResolveText(common::DiscoverySettings{}), "192.168.7.0/24");
    ASSERT_EQ(runner.Calls().size(), 1u);
    EXPECT_EQ(runner.Calls()[0].timeout, std::chrono::milliseconds(5000));
}

TEST(RangeResolverTest, FallsThroughToRoutePrint)
{
    FakeCommandRunner runner([](const std::string &cmd, std::chrono::milliseconds)
                             {
                                 if (cmd == "route print")
                                     return CommandResult::Exit(0,
                                         "Network Destination        Netmask          Gateway       Interface  Metric\n"
                                         "          0.0.0.0          0.0.0.0      192.168.0.1    192.168.0.23     25\n");
                                 return CommandResult::Missing();
                             });
    discovery::RangeResolver resolver(runner);

    EXPECT_EQ(resolver.ResolveText(common::DiscoverySettings{}), "192.168.0.0/24");
    EXPECT_EQ(runner.Commands(), (std::vector<std::string>{"ip route show default", "route print"}));
}

TEST(RangeResolverTest, NetstatGatewayColumnIsFound)
{
    const std::string netstat =
        "Kernel IP routing table\n"
        "Destination     Gateway         Genmask         Flags   MSS Window  irtt Iface\n"
        "0.0.0.0         10.0.0.1        0.0.0.0         UG        0 0          0 eth0\n";
    EXPECT_EQ(discovery::RangeResolver::ParseGateway(netstat), "10.0.0.1");
}

TEST(RangeResolverTest, UnparsableOutputYieldsNoGateway)
{
    EXPECT_FALSE(discovery::RangeResolver::ParseGateway("").has_value());
    EXPECT_FALSE(discovery::RangeResolver::ParseGateway("default via nowhere\n").has_value());
    EXPECT_FALSE(discovery::RangeResolver::ParseGateway("0.0.0.0 0.0.0.0 0.0.0.0\n").has_value());
}

TEST(RangeResolverTest, AutoFallsBackWhenNothingWorks)
{
    FakeCommandRunner runner([](const std::string &, std::chrono::milliseconds)
                             { return CommandResult::Exit(1); });
    discovery::RangeResolver resolver(runner);

    EXPECT_EQ(resolver.ResolveText(common::DiscoverySettings{}), "192.168.1.0/24");
    EXPECT_EQ(runner.Calls().size(), 3u);
}

TEST(MacResolverTest, MatchesWholeAddressOnly)
{
    const std::string table =
        "? (192.168.1.10) at 11:22:33:44:55:66 [ether] on eth0\n"
        "? (192.168.1.1) at aa:bb:cc:dd:ee:ff [ether] on eth0\n";
    EXPECT_EQ(discovery::MacResolver::FindMacForIp(table, "192.168.1.1"), "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(discovery::MacResolver::FindMacForIp(table, "192.168.1.10"), "11:22:33:44:55:66");
    EXPECT_FALSE(discovery::MacResolver::FindMacForIp(table, "192.168.1.2").has_value());
}

TEST(MacResolverTest, TriesEachCacheCommandUntilMatch)
{
    FakeCommandRunner runner([](const std::string &cmd, std::chrono::milliseconds)
                             {
                                 if (cmd == "arp -n")
                                     return CommandResult::Exit(0, "Address  HWtype  HWaddress  Flags Mask  Iface\n");
                                 if (cmd == "arp -a")
                                     return CommandResult::Exit(0, "? (10.0.0.7) at de:ad:be:ef:00:01 [ether] on wlan0\n");
                                 return CommandResult::Missing();
                             });
    discovery::MacResolver resolver(runner);

    EXPECT_EQ(resolver.ResolveMac("10.0.0.7"), "DE:AD:BE:EF:00:01");
    EXPECT_EQ(runner.Commands(), (std::vector<std::string>{"arp -n", "arp -a"}));
    EXPECT_EQ(runner.Calls()[0].timeout, std::chrono::milliseconds(2000));
}

TEST(MacResolverTest, AbsentEverywhereYieldsNothing)
{
    FakeCommandRunner runner([](const std::string &, std::chrono::milliseconds)
                             { return CommandResult::Exit(0, ""); });
    discovery::MacResolver resolver(runner);

    EXPECT_FALSE(resolver.ResolveMac("10.0.0.7").has_value());
    EXPECT_EQ(runner.Calls().size(), 3u);
}

TEST(MacResolverTest, InverseLookupAcceptsAnyMacSpelling)
{
    FakeCommandRunner runner([](const std::string &cmd, std::chrono::milliseconds)
                             {
                                 if (cmd == "ip neighbor")
                                     return CommandResult::Exit(0, "192.168.1.20 dev eth0 lladdr aa:bb:cc:dd:ee:ff REACHABLE\n");
                                 return CommandResult::Missing();
                             });
    discovery::MacResolver resolver(runner);

    EXPECT_EQ(resolver.ResolveIp("AA-BB-CC-DD-EE-FF"), "192.168.1.20");
    EXPECT_EQ(runner.Commands(), (std::vector<std::string>{"arp -n", "ip neighbor"}));
}

TEST(MacResolverTest, InverseLookupReadsWindowsTable)
{
    const std::string table =
        "Interface: 192.168.0.23 --- 0xb\n"
        "  Internet Address      Physical Address      Type\n"
        "  192.168.0.1           00-1a-2b-3c-4d-5e     dynamic\n";
    EXPECT_EQ(discovery::MacResolver::FindIpForMac(table, "00:1A:2B:3C:4D:5E"), "192.168.0.1");
    EXPECT_FALSE(discovery::MacResolver::FindIpForMac(table, "00:1A:2B:3C:4D:5F").has_value());
}
