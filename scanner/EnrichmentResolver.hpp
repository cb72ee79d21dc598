#pragma once

#include <memory>
#include <string>
#include "../common/HostRecord.hpp"
#include "NameResolvers.hpp"
#include "NeighborTable.hpp"
#include "OnlineVendorClient.hpp"

namespace lan_recon::scanner
{
    class HostEnricher
    {
    public:
        virtual ~HostEnricher() = default;

        // Fills hardware address, hostname and vendor. Never throws.
        virtual void Enrich(common::HostRecord &record) = 0;
    };

    class EnrichmentResolver : public HostEnricher
    {
    public:
        // `onlineVendors` may be null to keep lookups offline.
        EnrichmentResolver(std::shared_ptr<NeighborSource> neighbors,
                           HostnameChain hostnames,
                           std::shared_ptr<VendorLookup> onlineVendors,
                           std::string localMac);

        void Enrich(common::HostRecord &record) override;

        std::string ResolveHardwareAddress(const common::HostRecord &record);
        std::string ResolveHostname(const common::Ipv4Address &address);
        void ResolveVendor(common::HostRecord &record);

    private:
        std::shared_ptr<NeighborSource> m_neighbors;
        HostnameChain m_hostnames;
        std::shared_ptr<VendorLookup> m_onlineVendors;
        std::string m_localMac;
    };
}
