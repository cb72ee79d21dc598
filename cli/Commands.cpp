#include "Commands.hpp"
#include "../common/Channel.hpp"
#include "../common/CommandRunner.hpp"
#include "../common/Ipv4Address.hpp"
#include "../common/WorkerPool.hpp"
#include "../monitor/MonitorLoop.hpp"
#include "../scanner/DiscoveryOrchestrator.hpp"
#include "../scanner/EnrichmentResolver.hpp"
#include "../scanner/FingerprintEngine.hpp"
#include "../scanner/LivenessProbe.hpp"
#include "../scanner/LocalInterface.hpp"
#include "../scanner/NameResolvers.hpp"
#include "../scanner/NeighborTable.hpp"
#include "../scanner/OnlineVendorClient.hpp"
#include "../scanner/PortScanner.hpp"
#include "../scanner/TopologyAssistant.hpp"
#include "../tools/ResultExporter.hpp"
#include "../tools/WakeOnLan.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace lan_recon::cli
{
    namespace
    {
        const size_t ENRICH_WORKERS = 8;

        struct Toolkit
        {
            scanner::LocalInterface iface;
            common::Segment segment;
            std::shared_ptr<scanner::NeighborTableReader> neighbors;
            std::shared_ptr<scanner::TopologyAssistant> topology;
            std::shared_ptr<scanner::DiscoveryOrchestrator> orchestrator;
            std::shared_ptr<scanner::EnrichmentResolver> enricher;
        };

        common::Ipv4Address RequireAddress(const std::string &text, const std::string &option)
        {
            if (text.empty())
                throw std::invalid_argument("This command requires --" + option);
            auto address = common::Ipv4Address::Parse(text);
            if (!address)
                throw std::invalid_argument("Invalid address for --" + option + ": " + text);
            return *address;
        }

        common::AddressSet ParseExcludes(const std::vector<std::string> &items)
        {
            common::AddressSet exclude;
            for (const auto &item : items)
                exclude.insert(RequireAddress(item, "exclude"));
            return exclude;
        }

        std::shared_ptr<scanner::VendorLookup> OnlineVendors(const AppConfig &config)
        {
            if (!config.onlineVendor)
                return nullptr;
            return std::make_shared<scanner::OnlineVendorClient>();
        }

        Toolkit BuildToolkit(const AppConfig &config)
        {
            Toolkit kit;
            kit.iface = scanner::DetectLocalInterface(config.interfaceName);
            kit.segment = kit.iface.GetSegment();

            if (!config.segment.empty())
            {
                auto requested = common::Segment::Parse(config.segment);
                if (!requested)
                    throw std::invalid_argument("Invalid segment: " + config.segment);
                if (!requested->Contains(kit.iface.address))
                    throw std::invalid_argument("Segment " + requested->Cidr() + " is not attached to " +
                                                kit.iface.name + " (" + kit.iface.address.ToString() + ")");
                kit.segment = *requested;
            }

            auto runner = std::make_shared<common::PosixCommandRunner>();
            kit.neighbors = std::make_shared<scanner::NeighborTableReader>(runner);

            if (config.useTopologyAssistant)
            {
                auto topology = std::make_shared<scanner::TopologyAssistant>(runner);
                if (topology->IsInstalled())
                    kit.topology = topology;
                else if (!config.quiet)
                    std::cout << "[Discovery] nmap not found, skipping the bulk pass\n";
            }

            auto probe = std::make_shared<scanner::LivenessProbe>(kit.neighbors);
            kit.orchestrator = std::make_shared<scanner::DiscoveryOrchestrator>(kit.iface.address, kit.neighbors,
                                                                                kit.topology, probe);
            kit.enricher = std::make_shared<scanner::EnrichmentResolver>(
                kit.neighbors, scanner::DefaultHostnameChain(kit.neighbors, kit.topology),
                OnlineVendors(config), kit.iface.mac);

            if (!config.quiet)
                std::cout << "[Discovery] Interface " << kit.iface.name << " " << kit.iface.address.ToString()
                          << " (" << kit.iface.mac << "), segment " << kit.segment.Cidr() << "\n";
            return kit;
        }

        void EnrichAll(scanner::HostEnricher &enricher, common::KnownHostSet &hosts,
                       const common::CancellationToken &token)
        {
            common::Channel<common::HostRecord *> jobs;
            for (auto &entry : hosts)
                jobs.Send(&entry.second);
            jobs.Close();

            common::WorkerPool pool;
            pool.Start(std::min(ENRICH_WORKERS, hosts.size()), [&]()
                       {
                while (auto record = jobs.Receive())
                {
                    if (!token.IsCancelled())
                        enricher.Enrich(**record);
                } });
            pool.Join();
        }

        void PrintHosts(const common::KnownHostSet &hosts)
        {
            std::cout << std::left << std::setw(16) << "IP" << std::setw(19) << "MAC"
                      << std::setw(22) << "VENDOR" << "HOSTNAME\n";
            for (const auto &entry : hosts)
            {
                const common::HostRecord &record = entry.second;
                std::cout << std::left << std::setw(16) << record.address.ToString()
                          << std::setw(19) << record.hardwareAddress
                          << std::setw(22) << record.vendor.substr(0, 21)
                          << record.hostname << (record.isLocalMachine ? "  (this machine)" : "") << "\n";
            }
            std::cout << hosts.size() << " device(s)\n";
        }

        std::string DescribeHost(const common::HostRecord &record)
        {
            return record.address.ToString() + "  " + record.hardwareAddress + "  " + record.vendor + "  " + record.hostname;
        }

        int RunScan(const AppConfig &config, const common::CancellationToken &token)
        {
            Toolkit kit = BuildToolkit(config);
            common::AddressSet exclude = ParseExcludes(config.exclude);

            scanner::ScanOptions options;
            options.workers = config.workers;
            options.probe.connectTimeout = std::chrono::milliseconds(config.timeoutMs);
            options.probe.useNeighborTable = config.useNeighborTable;
            options.useNeighborTable = config.useNeighborTable;
            options.useTopologyAssistant = kit.topology != nullptr;
            options.verbose = !config.quiet;

            scanner::ProgressCallback progress;
            if (!config.quiet)
            {
                progress = [](const scanner::ScanProgress &p)
                {
                    if (p.probed % 32 == 0 || p.probed == p.total)
                        std::cout << "[Discovery] Probed " << p.probed << "/" << p.total << ", " << p.alive << " alive\n";
                };
            }

            auto started = std::chrono::system_clock::now();
            auto hosts = kit.orchestrator->Discover(kit.segment, exclude, options, token, progress);
            EnrichAll(*kit.enricher, hosts, token);
            PrintHosts(hosts);

            tools::ScanReport report{tools::FormatScanTime(started), kit.segment.Cidr(), hosts};
            int rc = 0;
            if (!config.jsonPath.empty())
            {
                if (tools::WriteJson(report, config.jsonPath))
                    std::cout << "[Export] JSON written to " << config.jsonPath << "\n";
                else
                    rc = 1;
            }
            if (!config.htmlPath.empty())
            {
                if (tools::WriteHtml(report, config.htmlPath))
                    std::cout << "[Export] HTML report written to " << config.htmlPath << "\n";
                else
                    rc = 1;
            }

            if (token.IsCancelled())
            {
                std::cerr << "[Discovery] Interrupted, results are partial\n";
                return 130;
            }
            return rc;
        }

        int RunMonitor(const AppConfig &config, std::shared_ptr<common::CancellationToken> token)
        {
            common::AddressSet exclude = ParseExcludes(config.exclude);
            Toolkit kit = BuildToolkit(config);

            scanner::ScanOptions options = scanner::ScanOptions::Light();
            options.workers = std::min(options.workers, config.workers);

            monitor::MonitorLoop loop(kit.orchestrator, kit.enricher, kit.segment, kit.iface.address, exclude,
                                      options, std::chrono::seconds(config.intervalSeconds), token);

            std::cout << "[Monitor] Watching " << kit.segment.Cidr() << " every " << config.intervalSeconds
                      << "s, Ctrl-C to stop\n";
            loop.Start([](const monitor::MonitorEvent &event)
                       {
                if (event.type == monitor::MonitorEventType::Error)
                    std::cerr << "[Monitor] Error: " << event.message << "\n";
                else
                    std::cout << "[Monitor] " << monitor::ToString(event.type) << " " << DescribeHost(event.record) << "\n"; });

            while (!token->WaitFor(std::chrono::seconds(1)))
            {
            }
            loop.Stop();

            std::cout << "[Monitor] Stopped with " << loop.Known().size() << " known host(s)\n";
            return 0;
        }

        int RunWake(const AppConfig &config)
        {
            if (config.mac.empty())
                throw std::invalid_argument("wake requires --mac");

            tools::WakeOnLan wol(std::make_shared<tools::UdpBroadcastSender>(), config.broadcast);
            tools::WakeStatus status = wol.Wake(config.mac);
            switch (status)
            {
            case tools::WakeStatus::Sent:
                std::cout << "[WakeOnLan] Magic packet sent to " << config.mac << " via " << config.broadcast << ":"
                          << tools::WOL_PORT << "\n";
                return 0;
            case tools::WakeStatus::InvalidAddress:
                std::cerr << "[WakeOnLan] Invalid hardware address: " << config.mac << "\n";
                return 2;
            case tools::WakeStatus::SendError:
                std::cerr << "[WakeOnLan] Could not send the magic packet\n";
                return 1;
            }
            return 1;
        }

        int RunFingerprint(const AppConfig &config)
        {
            common::HostRecord record;
            record.address = RequireAddress(config.target, "target");

            auto neighbors = std::make_shared<scanner::NeighborTableReader>(std::make_shared<common::PosixCommandRunner>());
            scanner::EnrichmentResolver enricher(neighbors, scanner::DefaultHostnameChain(neighbors, nullptr),
                                                 OnlineVendors(config), "");
            enricher.Enrich(record);

            scanner::FingerprintEngine engine(std::chrono::milliseconds(config.timeoutMs));
            engine.Fingerprint(record);

            std::cout << DescribeHost(record) << "\n";
            std::cout << "Device type: " << record.deviceType << "\n";
            for (uint16_t port : record.openPorts)
                std::cout << "  " << port << "/tcp  " << scanner::ServiceName(port) << "\n";
            for (const auto &warning : scanner::SecurityWarnings(record.openPorts))
                std::cout << "[!] " << warning << "\n";
            return 0;
        }

        int RunPorts(const AppConfig &config)
        {
            common::Ipv4Address target = RequireAddress(config.target, "target");
            const auto &ports = scanner::CommonPorts();

            if (!config.quiet)
                std::cout << "[Ports] Scanning " << ports.size() << " common ports on " << target.ToString() << "\n";

            auto open = scanner::ScanPorts(target, ports, std::chrono::milliseconds(config.timeoutMs));
            for (uint16_t port : open)
                std::cout << std::left << std::setw(10) << (std::to_string(port) + "/tcp") << scanner::ServiceName(port) << "\n";
            std::cout << open.size() << " open port(s)\n";
            return 0;
        }

        int RunSubnet(const AppConfig &config)
        {
            if (config.cidr.empty())
                throw std::invalid_argument("subnet requires --cidr");

            common::SubnetInfo info = common::CalculateSubnet(config.cidr);
            std::cout << std::left
                      << std::setw(14) << "Address" << info.address.ToString() << "/" << info.prefixLength << "\n"
                      << std::setw(14) << "Netmask" << info.mask.ToString() << "\n"
                      << std::setw(14) << "Wildcard" << info.wildcard.ToString() << "\n"
                      << std::setw(14) << "Network" << info.network.ToString() << "\n"
                      << std::setw(14) << "Broadcast" << info.broadcast.ToString() << "\n"
                      << std::setw(14) << "First host" << info.firstHost.ToString() << "\n"
                      << std::setw(14) << "Last host" << info.lastHost.ToString() << "\n"
                      << std::setw(14) << "Hosts" << info.totalHosts << "\n"
                      << std::setw(14) << "Class" << info.addressClass << "\n"
                      << std::setw(14) << "Private" << (info.isPrivate ? "yes" : "no") << "\n";
            return 0;
        }
    }

    void RegisterCommands(CommandRegistry &registry, std::shared_ptr<common::CancellationToken> token)
    {
        registry.Add({"scan", "Discover and identify hosts on the local segment",
                      [token](const AppConfig &config)
                      { return RunScan(config, *token); }});
        registry.Add({"monitor", "Report hosts joining and leaving the segment",
                      [token](const AppConfig &config)
                      { return RunMonitor(config, token); }});
        registry.Add({"wake", "Send a Wake-on-LAN magic packet (--mac)", RunWake});
        registry.Add({"fingerprint", "Guess the device type of --target from its open ports", RunFingerprint});
        registry.Add({"ports", "TCP connect scan of common ports on --target", RunPorts});
        registry.Add({"subnet", "Subnet details for --cidr", RunSubnet});
    }
}
