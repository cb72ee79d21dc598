#include "TopologyAssistant.hpp"
#include <iostream>
#include <sstream>

namespace lan_recon::scanner
{
    std::vector<GrepableHost> ParseNmapGrepable(const std::string &text)
    {
        std::vector<GrepableHost> hosts;
        std::istringstream in(text);
        std::string line;

        while (std::getline(in, line))
        {
            const std::string marker = "Host: ";
            if (line.compare(0, marker.size(), marker) != 0)
                continue;

            std::istringstream ss(line.substr(marker.size()));
            std::string ip;
            ss >> ip;

            auto address = common::Ipv4Address::Parse(ip);
            if (!address)
                continue;

            GrepableHost host;
            host.address = *address;

            auto open = line.find('(');
            auto close = line.find(')', open == std::string::npos ? 0 : open);
            if (open != std::string::npos && close != std::string::npos && close > open + 1)
                host.ptrName = line.substr(open + 1, close - open - 1);

            host.up = line.find("Status: Up") != std::string::npos;
            hosts.push_back(host);
        }
        return hosts;
    }

    TopologyAssistant::TopologyAssistant(std::shared_ptr<common::CommandRunner> runner, std::string program)
        : m_runner(std::move(runner)), m_program(std::move(program))
    {
    }

    bool TopologyAssistant::IsInstalled() const
    {
        return m_runner && m_runner->IsAvailable(m_program);
    }

    common::AddressSet TopologyAssistant::BulkDiscover(const common::Segment &segment,
                                                       std::chrono::seconds timeoutBudget)
    {
        common::AddressSet found;
        if (!IsInstalled())
            return found;

        auto result = m_runner->Run({m_program, "-sn", "-oG", "-", segment.Cidr()}, timeoutBudget);
        if (!result.started || result.exitCode != 0)
        {
            std::cerr << "[TopologyAssistant] " << m_program << " exited with code " << result.exitCode
                      << ", ignoring bulk pass\n";
            return found;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &host : ParseNmapGrepable(result.output))
        {
            if (!host.up || !segment.Contains(host.address))
                continue;
            found.insert(host.address);
            if (!host.ptrName.empty())
                m_ptrNames[host.address] = host.ptrName;
        }
        return found;
    }

    std::optional<std::string> TopologyAssistant::PtrName(const common::Ipv4Address &address) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_ptrNames.find(address);
        if (it == m_ptrNames.end())
            return std::nullopt;
        return it->second;
    }
}
