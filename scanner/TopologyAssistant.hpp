#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../common/CommandRunner.hpp"
#include "../common/HostRecord.hpp"
#include "../common/Ipv4Address.hpp"

namespace lan_recon::scanner
{
    class BulkDiscovery
    {
    public:
        virtual ~BulkDiscovery() = default;

        // Best effort: empty when the helper is missing, fails or times out.
        virtual common::AddressSet BulkDiscover(const common::Segment &segment,
                                                std::chrono::seconds timeoutBudget) = 0;

        // PTR name reported for `address` by the last bulk pass.
        virtual std::optional<std::string> PtrName(const common::Ipv4Address &address) const = 0;
    };

    struct GrepableHost
    {
        common::Ipv4Address address;
        std::string ptrName;
        bool up = false;
    };

    // nmap "-oG" lines: "Host: 192.168.1.1 (router.lan)\tStatus: Up"
    std::vector<GrepableHost> ParseNmapGrepable(const std::string &text);

    class TopologyAssistant : public BulkDiscovery
    {
    public:
        explicit TopologyAssistant(std::shared_ptr<common::CommandRunner> runner,
                                   std::string program = "nmap");

        bool IsInstalled() const;

        common::AddressSet BulkDiscover(const common::Segment &segment,
                                        std::chrono::seconds timeoutBudget) override;
        std::optional<std::string> PtrName(const common::Ipv4Address &address) const override;

    private:
        std::shared_ptr<common::CommandRunner> m_runner;
        std::string m_program;

        mutable std::mutex m_mutex;
        std::map<common::Ipv4Address, std::string> m_ptrNames;
    };
}
