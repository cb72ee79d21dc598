#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "Ipv4Address.hpp"

namespace lan_recon::common
{
    inline constexpr const char *UNKNOWN = "Unknown";
    inline constexpr const char *PRIVATE_MAC = "Private MAC";

    struct HostRecord
    {
        Ipv4Address address;
        std::string hardwareAddress = UNKNOWN;
        std::string hostname = UNKNOWN;
        std::string vendor = UNKNOWN;
        bool isLocalMachine = false;
        bool hasRandomizedHardwareAddress = false;
        std::vector<uint16_t> openPorts;
        std::string deviceType;
    };

    // One record per address, iterated in numeric address order.
    using KnownHostSet = std::map<Ipv4Address, HostRecord>;

    using AddressSet = std::set<Ipv4Address>;
}
