#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>
#include "../common/Ipv4Address.hpp"
#include "NeighborTable.hpp"

namespace lan_recon::scanner
{
    struct ProbeSettings
    {
        std::vector<uint16_t> ports = {80, 443, 22, 445, 139, 8080, 53, 62078};
        std::chrono::milliseconds connectTimeout{500};
        std::chrono::milliseconds icmpTimeout{1000};
        bool useIcmp = true;
        bool useNeighborTable = true;

        // Fewer ports and tighter timeouts for repeated monitoring passes.
        static ProbeSettings Light();
    };

    class HostProbe
    {
    public:
        virtual ~HostProbe() = default;

        // Never throws; every probing failure is a negative signal.
        virtual bool IsAlive(const common::Ipv4Address &address, const ProbeSettings &settings) = 0;
    };

    class LivenessProbe : public HostProbe
    {
    public:
        explicit LivenessProbe(std::shared_ptr<NeighborSource> neighbors);

        bool IsAlive(const common::Ipv4Address &address, const ProbeSettings &settings) override;

        // One echo request through a raw socket; false without privilege.
        static bool IcmpEcho(const common::Ipv4Address &address, std::chrono::milliseconds timeout);

    private:
        std::shared_ptr<NeighborSource> m_neighbors;
    };
}
