#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "Fakes.hpp"
#include "common/NameQueryCodec.hpp"

using namespace lan_recon::common;
using namespace lan_recon::common::wire;
using lan_recon::test::Ip;

class NameQueryCodecTest : public ::testing::Test
{
protected:
    static void AppendNbName(std::vector<uint8_t> &out, const std::string &name, uint8_t suffix, uint16_t flags)
    {
        std::string padded = name;
        padded.resize(15, ' ');
        out.insert(out.end(), padded.begin(), padded.end());
        out.push_back(suffix);
        append_u16_be(out, flags);
    }

    static std::vector<uint8_t> NbstatResponse()
    {
        std::vector<uint8_t> packet;
        append_u16_be(packet, 0x1234);
        append_u16_be(packet, 0x8400);
        append_u16_be(packet, 0); // qdcount
        append_u16_be(packet, 1); // ancount
        append_u16_be(packet, 0);
        append_u16_be(packet, 0);

        packet.push_back(0x20);
        packet.push_back('C');
        packet.push_back('K');
        for (int i = 0; i < 30; ++i)
            packet.push_back('A');
        packet.push_back(0x00);
        append_u16_be(packet, NBSTAT_TYPE);
        append_u16_be(packet, 0x0001);
        append_u16_be(packet, 0);
        append_u16_be(packet, 0);
        append_u16_be(packet, 1 + 3 * 18);

        packet.push_back(3);
        AppendNbName(packet, "WORKGROUP", 0x00, 0x8400);
        AppendNbName(packet, "DESKTOP-7Q2", 0x20, 0x0400);
        AppendNbName(packet, "DESKTOP-7Q2", 0x00, 0x0400);
        return packet;
    }

    static std::vector<uint8_t> PtrResponse(const Ipv4Address &address, const std::string &target)
    {
        std::vector<uint8_t> packet = BuildPtrQuery(0x4242, address, false);
        packet[2] = 0x84;
        packet[3] = 0x00;
        packet[7] = 0x01; // ancount

        packet.push_back(0xC0); // pointer to the question name
        packet.push_back(0x0C);
        append_u16_be(packet, DNS_TYPE_PTR);
        append_u16_be(packet, 0x0001);
        append_u16_be(packet, 0);
        append_u16_be(packet, 120);

        std::vector<uint8_t> rdata;
        EncodeDnsName(target, rdata);
        append_u16_be(packet, static_cast<uint16_t>(rdata.size()));
        packet.insert(packet.end(), rdata.begin(), rdata.end());
        return packet;
    }
};

TEST_F(NameQueryCodecTest, ReverseName)
{
    EXPECT_EQ(ReverseName(Ip("192.168.1.42")), "42.1.168.192.in-addr.arpa");
}

TEST_F(NameQueryCodecTest, NbstatQueryLayout)
{
    auto query = BuildNbstatQuery(0xBEEF);
    ASSERT_EQ(query.size(), 50u);
    EXPECT_EQ(query[0], 0xBE);
    EXPECT_EQ(query[1], 0xEF);
    EXPECT_EQ(query[5], 1); // qdcount
    EXPECT_EQ(query[12], 0x20);
    EXPECT_EQ(query[13], 'C');
    EXPECT_EQ(query[14], 'K');
    EXPECT_EQ(query[45], 0x00);
    EXPECT_EQ(query[47], 0x21);
    EXPECT_EQ(query[49], 0x01);
}

TEST_F(NameQueryCodecTest, NbstatResponseYieldsWorkstationName)
{
    auto name = ParseNbstatResponse(NbstatResponse());
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "DESKTOP-7Q2");
}

TEST_F(NameQueryCodecTest, TruncatedNbstatResponseIsRejected)
{
    auto packet = NbstatResponse();
    packet.resize(packet.size() - 30);
    // Only the group entry and a partial one remain.
    EXPECT_FALSE(ParseNbstatResponse(packet).has_value());
    EXPECT_FALSE(ParseNbstatResponse({0x00, 0x01}).has_value());
}

TEST_F(NameQueryCodecTest, PtrQuerySetsUnicastBit)
{
    auto query = BuildPtrQuery(7, Ip("10.0.0.5"), true);
    ASSERT_GE(query.size(), 4u);
    EXPECT_EQ(query[query.size() - 4], 0x00);
    EXPECT_EQ(query[query.size() - 3], DNS_TYPE_PTR);
    EXPECT_EQ(query[query.size() - 2], 0x80);
    EXPECT_EQ(query[query.size() - 1], 0x01);

    size_t offset = 12;
    std::string name;
    ASSERT_TRUE(ReadDnsName(query, offset, name));
    EXPECT_EQ(name, "5.0.0.10.in-addr.arpa");
}

TEST_F(NameQueryCodecTest, PtrResponseStripsLocalSuffix)
{
    auto address = Ip("192.168.1.44");
    EXPECT_EQ(ParsePtrResponse(PtrResponse(address, "macbook.local")).value_or(""), "macbook");
    EXPECT_EQ(ParsePtrResponse(PtrResponse(address, "nas.example.com")).value_or(""), "nas.example.com");
}

TEST_F(NameQueryCodecTest, QueryIsNotAResponse)
{
    EXPECT_FALSE(ParsePtrResponse(BuildPtrQuery(1, Ip("192.168.1.44"), false)).has_value());
}

TEST_F(NameQueryCodecTest, PointerLoopIsRejected)
{
    std::vector<uint8_t> packet = {0xC0, 0x00};
    size_t offset = 0;
    std::string name;
    EXPECT_FALSE(ReadDnsName(packet, offset, name));
}
