#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include "scanner/FingerprintEngine.hpp"

using namespace lan_recon;

class FingerprintTest : public ::testing::Test
{
protected:
    common::HostRecord record;
};

TEST_F(FingerprintTest, TieGoesToFirstDeclaredSignature)
{
    // Router/Gateway and Web Server both score 3.
    EXPECT_EQ(scanner::Classify(record, {80, 443, 8080}), "Router/Gateway");
}

TEST_F(FingerprintTest, ClassificationIsDeterministic)
{
    const std::vector<uint16_t> ports = {22, 111, 445, 139};
    std::string first = scanner::Classify(record, ports);
    for (int i = 0; i < 10; ++i)
        EXPECT_EQ(scanner::Classify(record, ports), first);

    std::vector<uint16_t> reversed(ports.rbegin(), ports.rend());
    EXPECT_EQ(scanner::Classify(record, reversed), first);
}

TEST_F(FingerprintTest, HighestScoreWins)
{
    EXPECT_EQ(scanner::Classify(record, {515, 631, 9100, 80}), "Printer");
    EXPECT_EQ(scanner::Classify(record, {135, 139, 445, 3389}), "Windows PC");
    EXPECT_EQ(scanner::Classify(record, {22}), "Linux/Unix Host");
    EXPECT_EQ(scanner::Classify(record, {554, 37777}), "IP Camera");
    EXPECT_EQ(scanner::Classify(record, {1883}), "IoT Hub");
    EXPECT_EQ(scanner::Classify(record, {8009, 8008}), "Media/Smart TV");
}

TEST_F(FingerprintTest, NoMatchFallsBackOnMacKind)
{
    EXPECT_EQ(scanner::Classify(record, {}), "Stealth/Firewall");
    EXPECT_EQ(scanner::Classify(record, {5900}), "Stealth/Firewall");

    record.hasRandomizedHardwareAddress = true;
    EXPECT_EQ(scanner::Classify(record, {}), "Mobile Device");
}

TEST_F(FingerprintTest, ProbePortsCoverSignaturesAndDiagnostics)
{
    const auto &ports = scanner::ProbePorts();
    EXPECT_TRUE(std::is_sorted(ports.begin(), ports.end()));
    std::set<uint16_t> unique(ports.begin(), ports.end());
    EXPECT_EQ(unique.size(), ports.size());

    for (const auto &signature : scanner::Signatures())
    {
        for (uint16_t port : signature.ports)
            EXPECT_TRUE(unique.count(port)) << signature.label << " " << port;
    }
    for (uint16_t port : {21, 23, 3389, 5900})
        EXPECT_TRUE(unique.count(port)) << port;
}

TEST_F(FingerprintTest, SignatureOrder)
{
    const auto &signatures = scanner::Signatures();
    ASSERT_EQ(signatures.size(), 11u);
    EXPECT_EQ(signatures.front().label, "Router/Gateway");
    EXPECT_EQ(signatures[1].label, "Web Server");
    EXPECT_EQ(signatures.back().label, "IoT Hub");
}

TEST_F(FingerprintTest, SecurityWarnings)
{
    EXPECT_TRUE(scanner::SecurityWarnings({22, 80, 443}).empty());

    auto warnings = scanner::SecurityWarnings({21, 23, 3389, 5900});
    ASSERT_EQ(warnings.size(), 4u);
    EXPECT_NE(warnings[0].find("Telnet"), std::string::npos);
    EXPECT_NE(warnings[1].find("FTP"), std::string::npos);
    EXPECT_NE(warnings[2].find("RDP"), std::string::npos);
    EXPECT_NE(warnings[3].find("VNC"), std::string::npos);
}
