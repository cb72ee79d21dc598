#include "NeighborTable.hpp"
#include "../common/MacAddress.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace lan_recon::scanner
{
    namespace
    {
        const std::chrono::seconds COMMAND_TIMEOUT(3);

        // Empty when the text is not a usable (non-zero) hardware address.
        std::string NormalizeMac(const std::string &text)
        {
            auto mac = common::ParseMac(text);
            if (!mac || common::IsZeroMac(*mac))
                return "";
            return common::FormatMac(*mac);
        }

        std::vector<std::string> Tokens(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::istringstream ss(line);
            std::string token;
            while (ss >> token)
                tokens.push_back(token);
            return tokens;
        }
    }

    std::vector<NeighborEntry> ParseProcNetArp(const std::string &text)
    {
        std::vector<NeighborEntry> entries;
        std::istringstream in(text);
        std::string line;

        std::getline(in, line); // column header
        while (std::getline(in, line))
        {
            std::stringstream ss(line);
            std::string ip, hw_type, flags, mac, mask, dev;
            if (!(ss >> ip >> hw_type >> flags >> mac))
                continue;

            auto address = common::Ipv4Address::Parse(ip);
            if (!address)
                continue;

            NeighborEntry entry;
            entry.address = *address;
            entry.mac = NormalizeMac(mac);

            unsigned long flagBits = std::strtoul(flags.c_str(), nullptr, 16);
            entry.complete = (flagBits & 0x2) != 0 && !entry.mac.empty();
            entries.push_back(entry);
        }
        return entries;
    }

    std::vector<NeighborEntry> ParseIpNeigh(const std::string &text)
    {
        std::vector<NeighborEntry> entries;
        std::istringstream in(text);
        std::string line;

        while (std::getline(in, line))
        {
            auto tokens = Tokens(line);
            if (tokens.empty())
                continue;

            auto address = common::Ipv4Address::Parse(tokens[0]);
            if (!address)
                continue;

            NeighborEntry entry;
            entry.address = *address;

            bool failed = false;
            for (size_t i = 1; i < tokens.size(); ++i)
            {
                if (tokens[i] == "lladdr" && i + 1 < tokens.size())
                    entry.mac = NormalizeMac(tokens[i + 1]);
                else if (tokens[i] == "INCOMPLETE" || tokens[i] == "FAILED")
                    failed = true;
            }
            entry.complete = !failed && !entry.mac.empty();
            entries.push_back(entry);
        }
        return entries;
    }

    std::vector<NeighborEntry> ParseArpA(const std::string &text)
    {
        std::vector<NeighborEntry> entries;
        std::istringstream in(text);
        std::string line;

        while (std::getline(in, line))
        {
            auto tokens = Tokens(line);
            if (tokens.size() < 2)
                continue;

            NeighborEntry entry;
            bool parsed = false;

            // BSD / macOS / net-tools: "name (ip) at mac ..."
            for (size_t i = 0; i < tokens.size(); ++i)
            {
                const auto &t = tokens[i];
                if (t.size() < 3 || t.front() != '(' || t.back() != ')')
                    continue;

                auto address = common::Ipv4Address::Parse(t.substr(1, t.size() - 2));
                if (!address)
                    break;

                entry.address = *address;
                if (i > 0 && tokens[i - 1] != "?")
                    entry.name = tokens[i - 1];
                if (i + 2 < tokens.size() && tokens[i + 1] == "at")
                    entry.mac = NormalizeMac(tokens[i + 2]);
                parsed = true;
                break;
            }

            // Windows: "  ip   mac   type"
            if (!parsed)
            {
                auto address = common::Ipv4Address::Parse(tokens[0]);
                if (!address)
                    continue;
                entry.address = *address;
                entry.mac = NormalizeMac(tokens[1]);
                parsed = true;
            }

            entry.complete = !entry.mac.empty();
            entries.push_back(entry);
        }
        return entries;
    }

    NeighborTableReader::NeighborTableReader(std::shared_ptr<common::CommandRunner> runner,
                                             std::string procPath)
        : m_runner(std::move(runner)), m_procPath(std::move(procPath))
    {
    }

    std::vector<NeighborEntry> NeighborTableReader::ReadEntries()
    {
        try
        {
            std::ifstream arpFile(m_procPath);
            if (arpFile.is_open())
            {
                std::stringstream buffer;
                buffer << arpFile.rdbuf();
                return ParseProcNetArp(buffer.str());
            }

            if (!m_runner)
                return {};

            if (m_runner->IsAvailable("ip"))
            {
                auto result = m_runner->Run({"ip", "-4", "neigh", "show"}, COMMAND_TIMEOUT);
                if (result.started && result.exitCode == 0)
                    return ParseIpNeigh(result.output);
            }

            if (m_runner->IsAvailable("arp"))
            {
                auto result = m_runner->Run({"arp", "-a"}, COMMAND_TIMEOUT);
                if (result.started && result.exitCode == 0)
                    return ParseArpA(result.output);
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[NeighborTable] Read failed: " << e.what() << "\n";
        }
        return {};
    }

    common::AddressSet NeighborTableReader::ReadKnownHosts(const common::Segment &segment)
    {
        common::AddressSet hosts;
        for (const auto &entry : ReadEntries())
        {
            int octet = entry.address.Octet(3);
            if (entry.complete && segment.Contains(entry.address) &&
                octet >= common::Segment::FIRST_HOST && octet <= common::Segment::LAST_HOST)
                hosts.insert(entry.address);
        }
        return hosts;
    }

    std::optional<NeighborEntry> NeighborTableReader::Lookup(const common::Ipv4Address &address)
    {
        for (const auto &entry : ReadEntries())
        {
            if (entry.address == address)
                return entry;
        }
        return std::nullopt;
    }
}
