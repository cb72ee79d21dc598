#include "LocalInterface.hpp"
#include "../common/MacAddress.hpp"
#include <stdexcept>
#include <tins/tins.h>

namespace lan_recon::scanner
{
    LocalInterface DetectLocalInterface(const std::string &name)
    {
        try
        {
            Tins::NetworkInterface iface = name.empty()
                                               ? Tins::NetworkInterface::default_interface()
                                               : Tins::NetworkInterface(name);
            Tins::NetworkInterface::Info info = iface.info();

            auto address = common::Ipv4Address::Parse(info.ip_addr.to_string());
            auto netmask = common::Ipv4Address::Parse(info.netmask.to_string());
            if (!address || !netmask || address->Value() == 0)
                throw std::runtime_error("interface " + iface.name() + " has no IPv4 address");

            LocalInterface local;
            local.name = iface.name();
            local.address = *address;
            local.netmask = *netmask;
            local.mac = common::FormatMac(info.hw_addr);
            return local;
        }
        catch (const Tins::exception_base &e)
        {
            throw std::runtime_error(std::string("Local interface detection failed: ") + e.what());
        }
    }
}
