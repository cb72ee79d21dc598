#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "../common/MacAddress.hpp"

namespace lan_recon::scanner
{
    // Static OUI prefix table; nullopt when the prefix is not listed.
    std::optional<std::string> LookupVendor(const common::HardwareAddress &mac);

    size_t VendorTableSize();
}
