#include <gtest/gtest.h>
#include <stdexcept>
#include "common/Ipv4Address.hpp"

using namespace lan_recon::common;

class AddressTest : public ::testing::Test
{
protected:
    Ipv4Address Addr(const std::string &text)
    {
        auto parsed = Ipv4Address::Parse(text);
        EXPECT_TRUE(parsed.has_value()) << text;
        return parsed.value_or(Ipv4Address());
    }
};

TEST_F(AddressTest, ParsesAndPrintsDottedQuad)
{
    Ipv4Address address = Addr("192.168.1.42");
    EXPECT_EQ(address.Value(), 0xC0A8012Au);
    EXPECT_EQ(address.Octet(0), 192);
    EXPECT_EQ(address.Octet(3), 42);
    EXPECT_EQ(address.ToString(), "192.168.1.42");
    EXPECT_THROW(address.Octet(4), std::out_of_range);
}

TEST_F(AddressTest, RejectsMalformedText)
{
    EXPECT_FALSE(Ipv4Address::Parse("192.168.1").has_value());
    EXPECT_FALSE(Ipv4Address::Parse("192.168.1.256").has_value());
    EXPECT_FALSE(Ipv4Address::Parse("router").has_value());
    EXPECT_FALSE(Ipv4Address::Parse("").has_value());
}

TEST_F(AddressTest, OrdersNumerically)
{
    EXPECT_LT(Addr("10.0.0.2"), Addr("10.0.0.10"));
    EXPECT_LT(Addr("9.255.255.255"), Addr("10.0.0.0"));
}

TEST_F(AddressTest, SegmentCoversTheHostRange)
{
    auto segment = Segment::Parse("192.168.1.0/24");
    ASSERT_TRUE(segment.has_value());
    EXPECT_EQ(segment->Cidr(), "192.168.1.0/24");
    EXPECT_EQ(segment->Prefix(), "192.168.1");

    auto hosts = segment->Hosts();
    ASSERT_EQ(hosts.size(), 254u);
    EXPECT_EQ(hosts.front().ToString(), "192.168.1.1");
    EXPECT_EQ(hosts.back().ToString(), "192.168.1.254");

    EXPECT_TRUE(segment->Contains(Addr("192.168.1.200")));
    EXPECT_FALSE(segment->Contains(Addr("192.168.2.200")));
    EXPECT_EQ(segment->Host(7).ToString(), "192.168.1.7");
}

TEST_F(AddressTest, SegmentParseForms)
{
    EXPECT_EQ(Segment::Parse("10.0.5")->Cidr(), "10.0.5.0/24");
    EXPECT_EQ(Segment::Parse("10.0.5.77")->Cidr(), "10.0.5.0/24");
    EXPECT_FALSE(Segment::Parse("10.0.0.0/16").has_value());
    EXPECT_FALSE(Segment::Parse("not-a-segment").has_value());
}

TEST_F(AddressTest, SubnetCalculation)
{
    SubnetInfo info = CalculateSubnet("192.168.10.77/26");
    EXPECT_EQ(info.network.ToString(), "192.168.10.64");
    EXPECT_EQ(info.broadcast.ToString(), "192.168.10.127");
    EXPECT_EQ(info.mask.ToString(), "255.255.255.192");
    EXPECT_EQ(info.wildcard.ToString(), "0.0.0.63");
    EXPECT_EQ(info.firstHost.ToString(), "192.168.10.65");
    EXPECT_EQ(info.lastHost.ToString(), "192.168.10.126");
    EXPECT_EQ(info.totalHosts, 62u);
    EXPECT_EQ(info.addressClass, "Class C");
    EXPECT_TRUE(info.isPrivate);
}

TEST_F(AddressTest, SubnetPointToPointAndSingleHost)
{
    SubnetInfo p2p = CalculateSubnet(Addr("10.1.1.1"), 31);
    EXPECT_EQ(p2p.totalHosts, 2u);
    EXPECT_EQ(p2p.firstHost.ToString(), "10.1.1.0");
    EXPECT_EQ(p2p.lastHost.ToString(), "10.1.1.1");

    SubnetInfo single = CalculateSubnet(Addr("8.8.8.8"), 32);
    EXPECT_EQ(single.totalHosts, 1u);
    EXPECT_EQ(single.network.ToString(), "8.8.8.8");
    EXPECT_FALSE(single.isPrivate);
    EXPECT_EQ(single.addressClass, "Class A");
}

TEST_F(AddressTest, SubnetDefaultsToSlash24)
{
    SubnetInfo info = CalculateSubnet("172.20.3.9");
    EXPECT_EQ(info.prefixLength, 24);
    EXPECT_EQ(info.totalHosts, 254u);
    EXPECT_EQ(info.addressClass, "Class B");
    EXPECT_TRUE(info.isPrivate);
}

TEST_F(AddressTest, SubnetRejectsBadInput)
{
    EXPECT_THROW(CalculateSubnet(Addr("10.0.0.1"), 33), std::invalid_argument);
    EXPECT_THROW(CalculateSubnet(Addr("10.0.0.1"), -1), std::invalid_argument);
    EXPECT_THROW(CalculateSubnet("10.0.0.1/abc"), std::invalid_argument);
    EXPECT_THROW(CalculateSubnet("10.0.0/8"), std::invalid_argument);
}
