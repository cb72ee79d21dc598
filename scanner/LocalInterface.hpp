#pragma once

#include <string>
#include "../common/Ipv4Address.hpp"

namespace lan_recon::scanner
{
    struct LocalInterface
    {
        std::string name;
        common::Ipv4Address address;
        common::Ipv4Address netmask;
        std::string mac;

        common::Segment GetSegment() const { return common::Segment(address); }
    };

    // Interface holding the default route, or the named one. Throws
    // std::runtime_error when it cannot be resolved.
    LocalInterface DetectLocalInterface(const std::string &name = "");
}
