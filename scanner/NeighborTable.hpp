#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../common/CommandRunner.hpp"
#include "../common/HostRecord.hpp"
#include "../common/Ipv4Address.hpp"

namespace lan_recon::scanner
{
    struct NeighborEntry
    {
        common::Ipv4Address address;
        std::string mac;  // normalized lowercase, empty when unresolved
        std::string name; // only some platforms report one
        bool complete = false;
    };

    class NeighborSource
    {
    public:
        virtual ~NeighborSource() = default;

        // Complete entries inside `segment`. Never throws; empty on failure.
        virtual common::AddressSet ReadKnownHosts(const common::Segment &segment) = 0;

        virtual std::optional<NeighborEntry> Lookup(const common::Ipv4Address &address) = 0;
    };

    class NeighborTableReader : public NeighborSource
    {
    public:
        explicit NeighborTableReader(std::shared_ptr<common::CommandRunner> runner,
                                     std::string procPath = "/proc/net/arp");

        common::AddressSet ReadKnownHosts(const common::Segment &segment) override;
        std::optional<NeighborEntry> Lookup(const common::Ipv4Address &address) override;

        // /proc/net/arp first, then `ip neigh show`, then `arp -a`.
        std::vector<NeighborEntry> ReadEntries();

    private:
        std::shared_ptr<common::CommandRunner> m_runner;
        std::string m_procPath;
    };

    std::vector<NeighborEntry> ParseProcNetArp(const std::string &text);
    std::vector<NeighborEntry> ParseIpNeigh(const std::string &text);
    std::vector<NeighborEntry> ParseArpA(const std::string &text);
}
