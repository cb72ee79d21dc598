#include "EnrichmentResolver.hpp"
#include "VendorTable.hpp"
#include <iostream>

namespace lan_recon::scanner
{
    EnrichmentResolver::EnrichmentResolver(std::shared_ptr<NeighborSource> neighbors,
                                           HostnameChain hostnames,
                                           std::shared_ptr<VendorLookup> onlineVendors,
                                           std::string localMac)
        : m_neighbors(std::move(neighbors)),
          m_hostnames(std::move(hostnames)),
          m_onlineVendors(std::move(onlineVendors)),
          m_localMac(std::move(localMac))
    {
    }

    void EnrichmentResolver::Enrich(common::HostRecord &record)
    {
        record.hardwareAddress = ResolveHardwareAddress(record);
        record.hostname = ResolveHostname(record.address);
        ResolveVendor(record);
    }

    std::string EnrichmentResolver::ResolveHardwareAddress(const common::HostRecord &record)
    {
        std::string raw;
        if (record.isLocalMachine)
        {
            raw = m_localMac;
        }
        else if (m_neighbors)
        {
            auto entry = m_neighbors->Lookup(record.address);
            if (entry)
                raw = entry->mac;
        }

        auto mac = common::ParseMac(raw);
        if (!mac || common::IsZeroMac(*mac))
            return common::UNKNOWN;
        return common::FormatMac(*mac);
    }

    std::string EnrichmentResolver::ResolveHostname(const common::Ipv4Address &address)
    {
        const std::string dotted = address.ToString();
        for (const auto &source : m_hostnames)
        {
            if (!source)
                continue;

            std::optional<std::string> name;
            try
            {
                name = source->Resolve(address);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Enrichment] " << source->Name() << " failed for " << dotted << ": " << e.what() << "\n";
                continue;
            }

            if (name && !name->empty() && *name != dotted)
                return *name;
        }
        return common::UNKNOWN;
    }

    void EnrichmentResolver::ResolveVendor(common::HostRecord &record)
    {
        record.vendor = common::UNKNOWN;
        record.hasRandomizedHardwareAddress = false;

        auto mac = common::ParseMac(record.hardwareAddress);
        if (!mac)
            return;

        if (common::IsLocallyAdministered(*mac))
        {
            record.vendor = common::PRIVATE_MAC;
            record.hasRandomizedHardwareAddress = true;
            return;
        }

        if (auto vendor = LookupVendor(*mac))
        {
            record.vendor = *vendor;
            return;
        }

        if (!m_onlineVendors)
            return;

        try
        {
            if (auto vendor = m_onlineVendors->Lookup(*mac))
                record.vendor = *vendor;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Enrichment] Online vendor lookup failed for " << record.hardwareAddress << ": " << e.what() << "\n";
        }
    }
}
