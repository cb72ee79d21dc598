#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>
#include "../common/CancellationToken.hpp"
#include "../common/HostRecord.hpp"
#include "../common/Ipv4Address.hpp"
#include "LivenessProbe.hpp"
#include "NeighborTable.hpp"
#include "TopologyAssistant.hpp"

namespace lan_recon::scanner
{
    struct ScanOptions
    {
        ProbeSettings probe;
        size_t workers = 48;
        bool useNeighborTable = true;
        bool useTopologyAssistant = true;
        bool activeProbing = true;
        std::chrono::seconds topologyTimeout{30};
        bool verbose = true;

        // Profile used by the monitor for its repeated passes.
        static ScanOptions Light();
    };

    struct ScanProgress
    {
        size_t probed = 0;
        size_t total = 0;
        size_t alive = 0;
    };

    using ProgressCallback = std::function<void(const ScanProgress &progress)>;

    class SegmentScanner
    {
    public:
        virtual ~SegmentScanner() = default;

        virtual common::AddressSet ScanAlive(const common::Segment &segment,
                                             const common::AddressSet &exclude,
                                             const ScanOptions &options,
                                             const common::CancellationToken &token) = 0;
    };

    class DiscoveryOrchestrator : public SegmentScanner
    {
    public:
        DiscoveryOrchestrator(common::Ipv4Address localAddress,
                              std::shared_ptr<NeighborSource> neighbors,
                              std::shared_ptr<BulkDiscovery> topology,
                              std::shared_ptr<HostProbe> probe);

        // Passive read, assisted bulk scan, concurrent probing, then a second
        // passive read. Phase results are unioned; the local machine is always
        // present and flagged.
        common::KnownHostSet Discover(const common::Segment &segment,
                                      const common::AddressSet &exclude,
                                      const ScanOptions &options,
                                      const common::CancellationToken &token,
                                      ProgressCallback progress = nullptr);

        common::AddressSet ScanAlive(const common::Segment &segment,
                                     const common::AddressSet &exclude,
                                     const ScanOptions &options,
                                     const common::CancellationToken &token) override;

        const common::Ipv4Address &LocalAddress() const { return m_localAddress; }

    private:
        common::AddressSet RunPhases(const common::Segment &segment,
                                     const common::AddressSet &exclude,
                                     const ScanOptions &options,
                                     const common::CancellationToken &token,
                                     const ProgressCallback &progress);

        common::AddressSet ProbeTargets(const std::vector<common::Ipv4Address> &targets,
                                        const ScanOptions &options,
                                        const common::CancellationToken &token,
                                        const ProgressCallback &progress);

        common::Ipv4Address m_localAddress;
        std::shared_ptr<NeighborSource> m_neighbors;
        std::shared_ptr<BulkDiscovery> m_topology;
        std::shared_ptr<HostProbe> m_probe;
    };
}
