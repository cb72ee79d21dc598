#include <gtest/gtest.h>
#include <boost/program_options/errors.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <vector>
#include "cli/AppConfig.hpp"
#include "cli/CommandRegistry.hpp"

using namespace lan_recon::cli;

class CommandRegistryTest : public ::testing::Test
{
protected:
    CommandRegistry registry;

    static AppConfig Parse(std::vector<const char *> args)
    {
        args.insert(args.begin(), "lanrecon");
        return ParseArguments(static_cast<int>(args.size()), args.data());
    }
};

TEST_F(CommandRegistryTest, KeepsRegistrationOrder)
{
    EXPECT_TRUE(registry.Add({"scan", "Discover hosts", [](const AppConfig &)
                              { return 0; }}));
    EXPECT_TRUE(registry.Add({"wake", "Wake a host", [](const AppConfig &)
                              { return 3; }}));

    ASSERT_EQ(registry.List().size(), 2u);
    EXPECT_EQ(registry.List()[0].id, "scan");
    EXPECT_EQ(registry.List()[1].id, "wake");

    const Command *wake = registry.Find("wake");
    ASSERT_NE(wake, nullptr);
    EXPECT_EQ(wake->handler(AppConfig{}), 3);
    EXPECT_EQ(registry.Find("nope"), nullptr);

    std::string usage = registry.Usage("lanrecon");
    EXPECT_LT(usage.find("scan"), usage.find("wake"));
}

TEST_F(CommandRegistryTest, RejectsDuplicatesAndEmptyEntries)
{
    EXPECT_TRUE(registry.Add({"scan", "", [](const AppConfig &)
                              { return 0; }}));
    EXPECT_FALSE(registry.Add({"scan", "again", [](const AppConfig &)
                               { return 1; }}));
    EXPECT_FALSE(registry.Add({"", "no id", [](const AppConfig &)
                               { return 0; }}));
    EXPECT_FALSE(registry.Add({"ghost", "no handler", nullptr}));
    EXPECT_EQ(registry.List().size(), 1u);
}

TEST_F(CommandRegistryTest, DefaultsWithoutOptions)
{
    AppConfig config = Parse({"scan"});
    EXPECT_EQ(config.command, "scan");
    EXPECT_EQ(config.workers, 48u);
    EXPECT_EQ(config.timeoutMs, 500);
    EXPECT_EQ(config.intervalSeconds, 5);
    EXPECT_TRUE(config.useNeighborTable);
    EXPECT_TRUE(config.useTopologyAssistant);
    EXPECT_FALSE(config.onlineVendor);
    EXPECT_FALSE(config.quiet);
    EXPECT_EQ(config.broadcast, "255.255.255.255");
}

TEST_F(CommandRegistryTest, CommandLineOptions)
{
    AppConfig config = Parse({"scan", "--workers", "16", "--no-nmap", "--no-arp", "--online-vendor",
                              "--exclude", "192.168.1.5", "192.168.1.6", "--json", "out.json", "-q"});
    EXPECT_EQ(config.workers, 16u);
    EXPECT_FALSE(config.useTopologyAssistant);
    EXPECT_FALSE(config.useNeighborTable);
    EXPECT_TRUE(config.onlineVendor);
    EXPECT_TRUE(config.quiet);
    EXPECT_EQ(config.jsonPath, "out.json");
    const std::vector<std::string> exclude = {"192.168.1.5", "192.168.1.6"};
    EXPECT_EQ(config.exclude, exclude);
}

TEST_F(CommandRegistryTest, ConfigFileFillsUnsetOptions)
{
    std::string path = ::testing::TempDir() + "lanrecon_test.ini";
    {
        std::ofstream file(path);
        file << "workers = 8\n"
             << "interval = 30\n"
             << "broadcast = 10.0.0.255\n";
    }

    AppConfig config = Parse({"monitor", "--config", path.c_str(), "--interval", "12"});
    EXPECT_EQ(config.workers, 8u);
    EXPECT_EQ(config.intervalSeconds, 12);
    EXPECT_EQ(config.broadcast, "10.0.0.255");
    std::remove(path.c_str());
}

TEST_F(CommandRegistryTest, InvalidInputThrows)
{
    EXPECT_THROW(Parse({"scan", "--workers", "many"}), boost::program_options::error);
    EXPECT_THROW(Parse({"scan", "--bogus"}), boost::program_options::error);
    EXPECT_THROW(Parse({"scan", "--workers", "0"}), std::invalid_argument);
    EXPECT_THROW(Parse({"scan", "--config", "/nonexistent/lanrecon.ini"}), std::invalid_argument);
}
