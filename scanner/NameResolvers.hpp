#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../common/Ipv4Address.hpp"
#include "NeighborTable.hpp"
#include "TopologyAssistant.hpp"

namespace lan_recon::scanner
{
    // One link of the hostname fallback chain. Resolve never throws.
    class HostnameSource
    {
    public:
        virtual ~HostnameSource() = default;
        virtual std::string Name() const = 0;
        virtual std::optional<std::string> Resolve(const common::Ipv4Address &address) = 0;
    };

    using HostnameChain = std::vector<std::shared_ptr<HostnameSource>>;

    class ReverseDnsSource : public HostnameSource
    {
    public:
        std::string Name() const override { return "reverse-dns"; }
        std::optional<std::string> Resolve(const common::Ipv4Address &address) override;
    };

    class NetBiosSource : public HostnameSource
    {
    public:
        explicit NetBiosSource(std::chrono::milliseconds timeout) : m_timeout(timeout) {}
        std::string Name() const override { return "netbios"; }
        std::optional<std::string> Resolve(const common::Ipv4Address &address) override;

    private:
        std::chrono::milliseconds m_timeout;
    };

    class MdnsSource : public HostnameSource
    {
    public:
        explicit MdnsSource(std::chrono::milliseconds timeout) : m_timeout(timeout) {}
        std::string Name() const override { return "mdns"; }
        std::optional<std::string> Resolve(const common::Ipv4Address &address) override;

    private:
        std::chrono::milliseconds m_timeout;
    };

    class HostsFileSource : public HostnameSource
    {
    public:
        explicit HostsFileSource(std::string path = "/etc/hosts") : m_path(std::move(path)) {}
        std::string Name() const override { return "hosts-file"; }
        std::optional<std::string> Resolve(const common::Ipv4Address &address) override;

    private:
        std::string m_path;
    };

    class NeighborNameSource : public HostnameSource
    {
    public:
        explicit NeighborNameSource(std::shared_ptr<NeighborSource> neighbors) : m_neighbors(std::move(neighbors)) {}
        std::string Name() const override { return "neighbor-table"; }
        std::optional<std::string> Resolve(const common::Ipv4Address &address) override;

    private:
        std::shared_ptr<NeighborSource> m_neighbors;
    };

    class TopologyPtrSource : public HostnameSource
    {
    public:
        explicit TopologyPtrSource(std::shared_ptr<BulkDiscovery> topology) : m_topology(std::move(topology)) {}
        std::string Name() const override { return "topology-ptr"; }
        std::optional<std::string> Resolve(const common::Ipv4Address &address) override;

    private:
        std::shared_ptr<BulkDiscovery> m_topology;
    };

    // First canonical name mapped to `address` in hosts(5) formatted text.
    std::optional<std::string> LookupHostsText(const std::string &text, const common::Ipv4Address &address);

    // Reverse DNS, NetBIOS, mDNS, hosts file, neighbor table, topology PTR.
    HostnameChain DefaultHostnameChain(std::shared_ptr<NeighborSource> neighbors,
                                       std::shared_ptr<BulkDiscovery> topology,
                                       std::chrono::milliseconds queryTimeout = std::chrono::milliseconds(800));
}
