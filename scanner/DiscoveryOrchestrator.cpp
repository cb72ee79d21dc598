#include "DiscoveryOrchestrator.hpp"
#include "../common/Channel.hpp"
#include "../common/WorkerPool.hpp"
#include <algorithm>
#include <iostream>

namespace lan_recon::scanner
{
    namespace
    {
        struct ProbeOutcome
        {
            common::Ipv4Address address;
            bool alive = false;
        };

        void RemoveExcluded(common::AddressSet &set, const common::AddressSet &exclude)
        {
            for (const auto &address : exclude)
                set.erase(address);
        }
    }

    ScanOptions ScanOptions::Light()
    {
        ScanOptions options;
        options.probe = ProbeSettings::Light();
        options.workers = 32;
        options.useTopologyAssistant = false;
        options.useNeighborTable = false;
        options.verbose = false;
        return options;
    }

    DiscoveryOrchestrator::DiscoveryOrchestrator(common::Ipv4Address localAddress,
                                                 std::shared_ptr<NeighborSource> neighbors,
                                                 std::shared_ptr<BulkDiscovery> topology,
                                                 std::shared_ptr<HostProbe> probe)
        : m_localAddress(localAddress),
          m_neighbors(std::move(neighbors)),
          m_topology(std::move(topology)),
          m_probe(std::move(probe))
    {
    }

    common::KnownHostSet DiscoveryOrchestrator::Discover(const common::Segment &segment,
                                                         const common::AddressSet &exclude,
                                                         const ScanOptions &options,
                                                         const common::CancellationToken &token,
                                                         ProgressCallback progress)
    {
        common::KnownHostSet hosts;
        for (const auto &address : RunPhases(segment, exclude, options, token, progress))
        {
            common::HostRecord record;
            record.address = address;
            record.isLocalMachine = (address == m_localAddress);
            hosts.emplace(address, record);
        }

        if (options.verbose)
            std::cout << "[Discovery] " << hosts.size() << " host(s) alive on " << segment.Cidr() << "\n";
        return hosts;
    }

    common::AddressSet DiscoveryOrchestrator::ScanAlive(const common::Segment &segment,
                                                        const common::AddressSet &exclude,
                                                        const ScanOptions &options,
                                                        const common::CancellationToken &token)
    {
        return RunPhases(segment, exclude, options, token, nullptr);
    }

    common::AddressSet DiscoveryOrchestrator::RunPhases(const common::Segment &segment,
                                                        const common::AddressSet &exclude,
                                                        const ScanOptions &options,
                                                        const common::CancellationToken &token,
                                                        const ProgressCallback &progress)
    {
        common::AddressSet alive;

        if (options.useNeighborTable && m_neighbors)
        {
            auto cached = m_neighbors->ReadKnownHosts(segment);
            if (options.verbose)
                std::cout << "[Discovery] Neighbor table: " << cached.size() << " known host(s)\n";
            alive.insert(cached.begin(), cached.end());
        }

        if (options.useTopologyAssistant && m_topology && !token.IsCancelled())
        {
            auto bulk = m_topology->BulkDiscover(segment, options.topologyTimeout);
            if (options.verbose)
                std::cout << "[Discovery] Assisted bulk scan: " << bulk.size() << " host(s)\n";
            alive.insert(bulk.begin(), bulk.end());
        }

        RemoveExcluded(alive, exclude);

        if (options.activeProbing && m_probe)
        {
            std::vector<common::Ipv4Address> targets;
            for (const auto &address : segment.Hosts())
            {
                if (address == m_localAddress || alive.count(address) || exclude.count(address))
                    continue;
                targets.push_back(address);
            }

            auto probed = ProbeTargets(targets, options, token, progress);
            if (options.verbose)
                std::cout << "[Discovery] Active probing: " << probed.size() << " of " << targets.size()
                          << " address(es) responded\n";
            alive.insert(probed.begin(), probed.end());
        }

        // Probing populates the neighbor cache as a side effect.
        if (options.useNeighborTable && m_neighbors)
        {
            auto refreshed = m_neighbors->ReadKnownHosts(segment);
            alive.insert(refreshed.begin(), refreshed.end());
            RemoveExcluded(alive, exclude);
        }

        alive.insert(m_localAddress);
        return alive;
    }

    common::AddressSet DiscoveryOrchestrator::ProbeTargets(const std::vector<common::Ipv4Address> &targets,
                                                           const ScanOptions &options,
                                                           const common::CancellationToken &token,
                                                           const ProgressCallback &progress)
    {
        common::AddressSet alive;
        if (targets.empty())
            return alive;

        common::Channel<common::Ipv4Address> jobs;
        common::Channel<ProbeOutcome> results;

        for (const auto &target : targets)
            jobs.Send(target);
        jobs.Close();

        auto worker = [&]()
        {
            while (auto job = jobs.Receive())
            {
                ProbeOutcome outcome;
                outcome.address = *job;

                // Jobs still queued after cancellation report a negative result.
                if (!token.IsCancelled())
                {
                    try
                    {
                        outcome.alive = m_probe->IsAlive(*job, options.probe);
                    }
                    catch (const std::exception &e)
                    {
                        std::cerr << "[Discovery] Probe of " << job->ToString() << " failed: " << e.what() << "\n";
                    }
                }
                results.Send(outcome);
            }
        };

        size_t workerCount = std::max<size_t>(1, std::min(options.workers, targets.size()));
        common::WorkerPool pool;
        pool.Start(workerCount, worker);

        ScanProgress state;
        state.total = targets.size();
        for (size_t i = 0; i < targets.size(); ++i)
        {
            auto outcome = results.Receive();
            if (!outcome)
                break;

            ++state.probed;
            if (outcome->alive)
            {
                alive.insert(outcome->address);
                ++state.alive;
            }
            if (progress)
                progress(state);
        }

        pool.Join();
        return alive;
    }
}
