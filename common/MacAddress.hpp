#pragma once

#include <optional>
#include <string>
#include <tins/hw_address.h>

namespace lan_recon::common
{
    using HardwareAddress = Tins::HWAddress<6>;

    // Accepts "aa:bb:cc:dd:ee:ff", "aa-bb-cc-dd-ee-ff", "aabb.ccdd.eeff",
    // "aabbccddeeff" and BSD-style "0:1c:b3:9:85:15". Anything that does not
    // decode to exactly six bytes yields nullopt.
    std::optional<HardwareAddress> ParseMac(const std::string &text);

    // Lowercase, colon separated.
    std::string FormatMac(const HardwareAddress &mac);

    // "AA:BB:CC"
    std::string OuiPrefix(const HardwareAddress &mac);

    bool IsZeroMac(const HardwareAddress &mac);

    // Locally administered bit (0x02) of the first octet: second hex digit 2, 6, A or E.
    bool IsLocallyAdministered(const HardwareAddress &mac);
}
