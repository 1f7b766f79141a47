#include <gtest/gtest.h>
#include "common/Ipv4.hpp"
#include "common/Errors.hpp"
#include "scanner/ArpDiscovery.hpp"
#include <algorithm>
#include <chrono>
#include <vector>

using namespace net_map;

TEST(Ipv4Test, ParseAndFormat)
{
    auto parsed = common::ParseIpv4("192.168.1.10");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, 0xC0A8010Au);
    EXPECT_EQ(common::FormatIpv4(0xC0A8010Au), "192.168.1.10");

    EXPECT_FALSE(common::ParseIpv4("192.168.1").has_value());
    EXPECT_FALSE(common::ParseIpv4("300.1.1.1").has_value());
    EXPECT_FALSE(common::ParseIpv4("").has_value());
}

TEST(Ipv4Test, PrefixAndMask)
{
    EXPECT_EQ(common::PrefixFromMask(0xFFFFFF00u), 24);
    EXPECT_EQ(common::PrefixFromMask(0xFFFFFFFFu), 32);
    EXPECT_EQ(common::PrefixFromMask(0u), 0);
    EXPECT_EQ(common::PrefixFromMask(0xFF00FF00u), -1);
    EXPECT_EQ(common::MaskFromPrefix(20), 0xFFFFF000u);
    EXPECT_EQ(common::MaskFromPrefix(0), 0u);
}

TEST(Ipv4Test, SubnetFromAddress)
{
    auto subnet = common::SubnetFromAddress("192.168.1.77", "255.255.255.0");
    ASSERT_TRUE(subnet.has_value());
    EXPECT_EQ(subnet->ToString(), "192.168.1.0/24");
    EXPECT_EQ(common::FormatIpv4(subnet->FirstHost()), "192.168.1.1");
    EXPECT_EQ(common::FormatIpv4(subnet->LastHost()), "192.168.1.254");
    EXPECT_TRUE(subnet->Contains("192.168.1.200"));
    EXPECT_FALSE(subnet->Contains("192.168.2.1"));
    EXPECT_FALSE(subnet->Contains("garbage"));

    EXPECT_FALSE(common::SubnetFromAddress("10.0.0.1", "0.0.0.0").has_value());
    EXPECT_FALSE(common::SubnetFromAddress("10.0.0.1", "255.0.255.0").has_value());
}

TEST(Ipv4Test, PointToPointSubnetKeepsBothAddresses)
{
    auto subnet = common::SubnetFromAddress("10.0.0.1", "255.255.255.254");
    ASSERT_TRUE(subnet.has_value());
    EXPECT_EQ(common::FormatIpv4(subnet->FirstHost()), "10.0.0.0");
    EXPECT_EQ(common::FormatIpv4(subnet->LastHost()), "10.0.0.1");
}

TEST(Ipv4Test, AddressOrderingIsNumeric)
{
    std::vector<std::string> ips = {"10.0.0.10", "bogus", "10.0.0.9", "9.255.255.255", "10.0.0.100"};
    std::sort(ips.begin(), ips.end(), common::AddressLess);

    std::vector<std::string> expected = {"9.255.255.255", "10.0.0.9", "10.0.0.10", "10.0.0.100", "bogus"};
    EXPECT_EQ(ips, expected);
}

TEST(Ipv4Test, OuiKeyNormalisesSeparators)
{
    EXPECT_EQ(common::OuiKey("00:1a:2b:3c:4d:5e"), std::optional<std::string>("001A2B"));
    EXPECT_EQ(common::OuiKey("00-1A-2B-3C-4D-5E"), std::optional<std::string>("001A2B"));
    EXPECT_EQ(common::OuiKey("001a.2b3c.4d5e"), std::optional<std::string>("001A2B"));
    EXPECT_FALSE(common::OuiKey("zz:zz:zz:00:00:00").has_value());
    EXPECT_FALSE(common::OuiKey("00:1a").has_value());
}

TEST(Ipv4Test, LocallyAdministeredBit)
{
    EXPECT_TRUE(common::IsLocallyAdministered("02:00:00:00:00:01"));
    EXPECT_TRUE(common::IsLocallyAdministered("DA:A1:19:00:00:01"));
    EXPECT_FALSE(common::IsLocallyAdministered("00:1A:2B:3C:4D:5E"));
    EXPECT_FALSE(common::IsLocallyAdministered("FC:FB:FB:01:02:03"));
    EXPECT_FALSE(common::IsLocallyAdministered(""));
}

TEST(ReplyCollectorTest, KeepsOnlyInSubnetRepliesFromOthers)
{
    auto subnet = common::SubnetFromAddress("192.168.1.5", "255.255.255.0");
    ASSERT_TRUE(subnet.has_value());
    scanner::ReplyCollector collector(*subnet, "192.168.1.5");

    EXPECT_TRUE(collector.Accept("192.168.1.1", "00:00:0c:00:00:01"));
    EXPECT_FALSE(collector.Accept("192.168.1.5", "aa:aa:aa:aa:aa:aa"));
    EXPECT_FALSE(collector.Accept("10.0.0.1", "bb:bb:bb:bb:bb:bb"));
    EXPECT_FALSE(collector.Accept("not-an-ip", "cc:cc:cc:cc:cc:cc"));

    std::vector<scanner::DiscoveredHost> hosts = collector.Hosts();
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0].ip, "192.168.1.1");
    EXPECT_TRUE(hosts[0].vendor.empty());
}

TEST(ReplyCollectorTest, LastReplyForAnAddressWins)
{
    auto subnet = common::SubnetFromAddress("10.0.0.1", "255.255.255.0");
    ASSERT_TRUE(subnet.has_value());
    scanner::ReplyCollector collector(*subnet, "10.0.0.1");

    collector.Accept("10.0.0.20", "00:00:00:00:00:01");
    collector.Accept("10.0.0.20", "00:00:00:00:00:02");

    EXPECT_EQ(collector.Size(), 1u);
    EXPECT_EQ(collector.Hosts()[0].mac, "00:00:00:00:00:02");
}

TEST(SweepTargetsTest, NarrowSubnetIsSweptWhole)
{
    auto subnet = common::SubnetFromAddress("192.168.1.5", "255.255.255.0");
    ASSERT_TRUE(subnet.has_value());

    scanner::SweepRange range = scanner::SweepTargets(*subnet, "192.168.1.5");

    EXPECT_EQ(common::FormatIpv4(range.first), "192.168.1.1");
    EXPECT_EQ(common::FormatIpv4(range.last), "192.168.1.254");
}

TEST(SweepTargetsTest, WideSubnetIsClampedToOwnSlash16)
{
    auto subnet = common::SubnetFromAddress("10.1.2.3", "255.0.0.0");
    ASSERT_TRUE(subnet.has_value());

    scanner::SweepRange range = scanner::SweepTargets(*subnet, "10.1.2.3");

    EXPECT_EQ(common::FormatIpv4(range.first), "10.1.0.0");
    EXPECT_EQ(common::FormatIpv4(range.last), "10.1.255.255");
    EXPECT_TRUE(subnet->Contains(range.first));
    EXPECT_TRUE(subnet->Contains(range.last));
}

TEST(SweepTargetsTest, ClampSkipsOuterNetworkAndBroadcast)
{
    auto low = common::SubnetFromAddress("10.0.4.4", "255.0.0.0");
    auto high = common::SubnetFromAddress("10.255.9.9", "255.0.0.0");
    ASSERT_TRUE(low.has_value());
    ASSERT_TRUE(high.has_value());

    EXPECT_EQ(common::FormatIpv4(scanner::SweepTargets(*low, "10.0.4.4").first), "10.0.0.1");
    EXPECT_EQ(common::FormatIpv4(scanner::SweepTargets(*high, "10.255.9.9").last), "10.255.255.254");
}

TEST(SweepTargetsTest, Slash16IsNotClamped)
{
    auto subnet = common::SubnetFromAddress("172.16.40.2", "255.255.0.0");
    ASSERT_TRUE(subnet.has_value());

    scanner::SweepRange range = scanner::SweepTargets(*subnet, "172.16.40.2");

    EXPECT_EQ(range.first, subnet->FirstHost());
    EXPECT_EQ(range.last, subnet->LastHost());
}

namespace
{
    struct SweepLog
    {
        int sweeps = 0;
        std::vector<std::chrono::milliseconds> waits;
    };

    scanner::ReplyCollector LanCollector()
    {
        return scanner::ReplyCollector(*common::SubnetFromAddress("10.0.0.1", "255.255.255.0"), "10.0.0.1");
    }
}

TEST(RunSweepsTest, SilentLanIsSweptOncePerRetry)
{
    scanner::ReplyCollector collector = LanCollector();
    SweepLog log;

    int sent = scanner::RunSweeps(
        collector,
        [&log]()
        { ++log.sweeps; },
        [&log](std::chrono::milliseconds wait)
        { log.waits.push_back(wait); },
        std::chrono::milliseconds(250), 2);

    EXPECT_EQ(sent, 3);
    EXPECT_EQ(log.sweeps, 3);
    ASSERT_EQ(log.waits.size(), 3u);
    for (const auto &wait : log.waits)
        EXPECT_EQ(wait, std::chrono::milliseconds(250));
    EXPECT_EQ(collector.Size(), 0u);
}

TEST(RunSweepsTest, StopsAfterFirstSweepThatGetsAReply)
{
    scanner::ReplyCollector collector = LanCollector();
    SweepLog log;

    int sent = scanner::RunSweeps(
        collector,
        [&log, &collector]()
        {
            ++log.sweeps;
            collector.Accept("10.0.0.20", "00:11:22:33:44:55");
        },
        [&log](std::chrono::milliseconds wait)
        { log.waits.push_back(wait); },
        std::chrono::milliseconds(250), 2);

    EXPECT_EQ(sent, 1);
    EXPECT_EQ(log.sweeps, 1);
    EXPECT_EQ(log.waits.size(), 1u);
}

TEST(RunSweepsTest, ZeroRetriesMeansOneSweep)
{
    scanner::ReplyCollector collector = LanCollector();
    SweepLog log;

    int sent = scanner::RunSweeps(
        collector,
        [&log]()
        { ++log.sweeps; },
        [&log](std::chrono::milliseconds wait)
        { log.waits.push_back(wait); },
        std::chrono::milliseconds(10), 0);

    EXPECT_EQ(sent, 1);
    EXPECT_EQ(log.sweeps, 1);
    EXPECT_EQ(log.waits.size(), 1u);
}

TEST(RunSweepsTest, ReplyArrivingDuringWaitEndsRetries)
{
    scanner::ReplyCollector collector = LanCollector();
    SweepLog log;

    int sent = scanner::RunSweeps(
        collector,
        [&log]()
        { ++log.sweeps; },
        [&log, &collector](std::chrono::milliseconds wait)
        {
            log.waits.push_back(wait);
            if (log.waits.size() == 2)
                collector.Accept("10.0.0.30", "00:11:22:33:44:66");
        },
        std::chrono::milliseconds(10), 5);

    EXPECT_EQ(sent, 2);
    EXPECT_EQ(log.sweeps, 2);
}
