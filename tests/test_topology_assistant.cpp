#include <gtest/gtest.h>
#include <memory>
#include "Fakes.hpp"
#include "scanner/TopologyAssistant.hpp"

using namespace lan_recon;
using lan_recon::test::Ip;

class TopologyAssistantTest : public ::testing::Test
{
protected:
    std::shared_ptr<test::FakeCommandRunner> runner = std::make_shared<test::FakeCommandRunner>();
    common::Segment segment = *common::Segment::Parse("10.0.0.0/24");

    const std::string grepable =
        "# Nmap 7.94 scan initiated as: nmap -sn -oG - 10.0.0.0/24\n"
        "Host: 10.0.0.1 (gateway.home)\tStatus: Up\n"
        "Host: 10.0.0.17 ()\tStatus: Up\n"
        "Host: 10.0.0.30 (printer.home)\tStatus: Down\n"
        "Host: 10.0.1.4 (elsewhere)\tStatus: Up\n"
        "# Nmap done: 256 IP addresses (2 hosts up) scanned in 2.31 seconds\n";
};

TEST_F(TopologyAssistantTest, ParsesGrepableOutput)
{
    auto hosts = scanner::ParseNmapGrepable(grepable);
    ASSERT_EQ(hosts.size(), 4u);
    EXPECT_EQ(hosts[0].address, Ip("10.0.0.1"));
    EXPECT_EQ(hosts[0].ptrName, "gateway.home");
    EXPECT_TRUE(hosts[0].up);
    EXPECT_EQ(hosts[1].ptrName, "");
    EXPECT_FALSE(hosts[2].up);
}

TEST_F(TopologyAssistantTest, BulkDiscoverKeepsUpHostsInSegment)
{
    runner->installed = {"nmap"};
    runner->results["nmap"] = {true, 0, grepable};

    scanner::TopologyAssistant assistant(runner);
    auto found = assistant.BulkDiscover(segment, std::chrono::seconds(30));
    EXPECT_EQ(found, test::Ips({"10.0.0.1", "10.0.0.17"}));

    ASSERT_EQ(runner->calls.size(), 1u);
    const std::vector<std::string> expected = {"nmap", "-sn", "-oG", "-", "10.0.0.0/24"};
    EXPECT_EQ(runner->calls[0], expected);

    EXPECT_EQ(assistant.PtrName(Ip("10.0.0.1")).value_or(""), "gateway.home");
    EXPECT_FALSE(assistant.PtrName(Ip("10.0.0.17")).has_value());
}

TEST_F(TopologyAssistantTest, MissingToolContributesNothing)
{
    scanner::TopologyAssistant assistant(runner);
    EXPECT_FALSE(assistant.IsInstalled());
    EXPECT_TRUE(assistant.BulkDiscover(segment, std::chrono::seconds(30)).empty());
    EXPECT_TRUE(runner->calls.empty());
}

TEST_F(TopologyAssistantTest, FailingToolContributesNothing)
{
    runner->installed = {"nmap"};
    runner->results["nmap"] = {true, 124, ""};

    scanner::TopologyAssistant assistant(runner);
    EXPECT_TRUE(assistant.BulkDiscover(segment, std::chrono::seconds(1)).empty());
}
