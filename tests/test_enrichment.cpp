#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <memory>
#include "Fakes.hpp"
#include "scanner/EnrichmentResolver.hpp"
#include "scanner/NameResolvers.hpp"
#include "scanner/OnlineVendorClient.hpp"
#include "scanner/VendorTable.hpp"

using namespace lan_recon;
using lan_recon::test::Ip;

class EnrichmentTest : public ::testing::Test
{
protected:
    std::shared_ptr<test::FakeNeighborSource> neighbors = std::make_shared<test::FakeNeighborSource>();
    std::shared_ptr<test::FakeVendorLookup> online = std::make_shared<test::FakeVendorLookup>();

    common::HostRecord Record(const std::string &ip, bool local = false)
    {
        common::HostRecord record;
        record.address = Ip(ip);
        record.isLocalMachine = local;
        return record;
    }
};

TEST_F(EnrichmentTest, FirstNameInChainOrderWins)
{
    auto first = std::make_shared<test::FakeHostnameSource>("first", std::map<common::Ipv4Address, std::string>{});
    auto second = std::make_shared<test::FakeHostnameSource>(
        "second", std::map<common::Ipv4Address, std::string>{{Ip("192.168.1.5"), "printer"}});
    auto third = std::make_shared<test::FakeHostnameSource>(
        "third", std::map<common::Ipv4Address, std::string>{{Ip("192.168.1.5"), "ignored"}});

    scanner::EnrichmentResolver resolver(neighbors, {first, second, third}, nullptr, "");
    auto record = Record("192.168.1.5");
    resolver.Enrich(record);

    EXPECT_EQ(record.hostname, "printer");
    EXPECT_EQ(first->calls, 1);
    EXPECT_EQ(second->calls, 1);
    EXPECT_EQ(third->calls, 0);
}

TEST_F(EnrichmentTest, EmptyOrAddressEchoNamesAreSkipped)
{
    auto echo = std::make_shared<test::FakeHostnameSource>(
        "echo", std::map<common::Ipv4Address, std::string>{{Ip("192.168.1.5"), "192.168.1.5"}});
    auto empty = std::make_shared<test::FakeHostnameSource>(
        "empty", std::map<common::Ipv4Address, std::string>{{Ip("192.168.1.5"), ""}});
    auto real = std::make_shared<test::FakeHostnameSource>(
        "real", std::map<common::Ipv4Address, std::string>{{Ip("192.168.1.5"), "kitchen-speaker"}});

    scanner::EnrichmentResolver resolver(neighbors, {echo, empty, real}, nullptr, "");
    auto record = Record("192.168.1.5");
    resolver.Enrich(record);
    EXPECT_EQ(record.hostname, "kitchen-speaker");
}

TEST_F(EnrichmentTest, UnresolvedFieldsStayUnknown)
{
    scanner::EnrichmentResolver resolver(neighbors, {}, nullptr, "");
    auto record = Record("192.168.1.99");
    resolver.Enrich(record);

    EXPECT_EQ(record.hostname, common::UNKNOWN);
    EXPECT_EQ(record.hardwareAddress, common::UNKNOWN);
    EXPECT_EQ(record.vendor, common::UNKNOWN);
    EXPECT_FALSE(record.hasRandomizedHardwareAddress);
}

TEST_F(EnrichmentTest, HardwareAddressAndVendorFromTable)
{
    neighbors->AddEntry("192.168.1.20", "b8:27:eb:11:22:33");
    scanner::EnrichmentResolver resolver(neighbors, {}, online, "");

    auto record = Record("192.168.1.20");
    resolver.Enrich(record);
    EXPECT_EQ(record.hardwareAddress, "b8:27:eb:11:22:33");
    EXPECT_EQ(record.vendor, "Raspberry Pi");
    EXPECT_EQ(online->calls, 0);
}

TEST_F(EnrichmentTest, LocallyAdministeredAddressIsPrivate)
{
    // da:a1:19 is a locally administered prefix even though it looks vendor-like.
    neighbors->AddEntry("192.168.1.21", "da:a1:19:00:00:01");
    online->answer = "Should Not Be Asked";
    scanner::EnrichmentResolver resolver(neighbors, {}, online, "");

    auto record = Record("192.168.1.21");
    resolver.Enrich(record);
    EXPECT_EQ(record.vendor, common::PRIVATE_MAC);
    EXPECT_TRUE(record.hasRandomizedHardwareAddress);
    EXPECT_EQ(online->calls, 0);
}

TEST_F(EnrichmentTest, OnlineLookupForUnlistedPrefix)
{
    neighbors->AddEntry("192.168.1.22", "00:aa:bb:00:00:01");
    online->answer = "Example Networks";
    scanner::EnrichmentResolver resolver(neighbors, {}, online, "");

    auto record = Record("192.168.1.22");
    resolver.Enrich(record);
    EXPECT_EQ(record.vendor, "Example Networks");
    EXPECT_EQ(online->calls, 1);

    online->answer.reset();
    auto other = Record("192.168.1.22");
    resolver.Enrich(other);
    EXPECT_EQ(other.vendor, common::UNKNOWN);
}

TEST_F(EnrichmentTest, LocalMachineUsesInterfaceAddress)
{
    neighbors->AddEntry("192.168.1.10", "00:0c:29:99:99:99");
    scanner::EnrichmentResolver resolver(neighbors, {}, nullptr, "08:00:27:aa:bb:cc");

    auto record = Record("192.168.1.10", true);
    resolver.Enrich(record);
    EXPECT_EQ(record.hardwareAddress, "08:00:27:aa:bb:cc");
    EXPECT_EQ(record.vendor, "Oracle VirtualBox");
}

TEST_F(EnrichmentTest, NeighborAndTopologyNameSources)
{
    neighbors->AddEntry("192.168.1.30", "00:11:32:aa:bb:cc", "nas.lan");
    auto bulk = std::make_shared<test::FakeBulkDiscovery>();
    bulk->names[Ip("192.168.1.31")] = "camera.lan";

    scanner::NeighborNameSource neighborNames(neighbors);
    scanner::TopologyPtrSource ptrNames(bulk);
    EXPECT_EQ(neighborNames.Resolve(Ip("192.168.1.30")).value_or(""), "nas.lan");
    EXPECT_FALSE(neighborNames.Resolve(Ip("192.168.1.31")).has_value());
    EXPECT_EQ(ptrNames.Resolve(Ip("192.168.1.31")).value_or(""), "camera.lan");
}

TEST_F(EnrichmentTest, HostsTextLookup)
{
    const std::string hosts =
        "127.0.0.1   localhost\n"
        "# 192.168.1.40 commented-out\n"
        "192.168.1.40  media-server media  # living room\n";

    EXPECT_EQ(scanner::LookupHostsText(hosts, Ip("192.168.1.40")).value_or(""), "media-server");
    EXPECT_FALSE(scanner::LookupHostsText(hosts, Ip("192.168.1.41")).has_value());
}

TEST_F(EnrichmentTest, DefaultChainOrder)
{
    auto chain = scanner::DefaultHostnameChain(neighbors, nullptr);
    std::vector<std::string> names;
    for (const auto &source : chain)
        names.push_back(source->Name());

    const std::vector<std::string> expected = {"reverse-dns", "netbios", "mdns", "hosts-file", "neighbor-table", "topology-ptr"};
    EXPECT_EQ(names, expected);
}

TEST_F(EnrichmentTest, VendorTableLookup)
{
    EXPECT_GT(scanner::VendorTableSize(), 100u);
    EXPECT_EQ(scanner::LookupVendor(*common::ParseMac("00:0c:29:00:00:00")).value_or(""), "VMware");
    EXPECT_FALSE(scanner::LookupVendor(*common::ParseMac("00:aa:bb:00:00:00")).has_value());
}

TEST_F(EnrichmentTest, HttpResponseParsing)
{
    auto ok = scanner::ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n\r\nRaspberry Pi Trading Ltd\n");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->status, 200);
    EXPECT_EQ(ok->body, "Raspberry Pi Trading Ltd");

    auto missing = scanner::ParseHttpResponse("HTTP/1.1 404 Not Found\r\n\r\n{\"errors\":{\"detail\":\"Not Found\"}}");
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->status, 404);

    EXPECT_FALSE(scanner::ParseHttpResponse("garbage").has_value());
    EXPECT_FALSE(scanner::ParseHttpResponse("").has_value());
}

TEST_F(EnrichmentTest, RateLimiterSpacesCalls)
{
    scanner::RateLimiter limiter(std::chrono::milliseconds(50));
    auto start = std::chrono::steady_clock::now();
    limiter.Acquire();
    limiter.Acquire();
    limiter.Acquire();
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, std::chrono::milliseconds(100));
}
