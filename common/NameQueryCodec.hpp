#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "Ipv4Address.hpp"

namespace lan_recon::common::wire
{
    inline constexpr uint16_t NETBIOS_NS_PORT = 137;
    inline constexpr uint16_t MDNS_PORT = 5353;
    inline constexpr uint16_t DNS_TYPE_PTR = 12;
    inline constexpr uint16_t NBSTAT_TYPE = 0x21;

    inline void append_u16_be(std::vector<std::uint8_t> &out, std::uint16_t value)
    {
        out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
        out.push_back(static_cast<std::uint8_t>(value & 0xFF));
    }

    inline bool read_u16_be(const std::vector<std::uint8_t> &in, std::size_t &offset, std::uint16_t &value_out)
    {
        if (offset + 2 > in.size())
            return false;
        value_out = static_cast<std::uint16_t>((in[offset] << 8) | in[offset + 1]);
        offset += 2;
        return true;
    }

    // "d.c.b.a.in-addr.arpa"
    std::string ReverseName(const Ipv4Address &address);

    bool EncodeDnsName(const std::string &name, std::vector<std::uint8_t> &out);

    // Follows compression pointers; `offset` is left after the name as it
    // appears at the starting position.
    bool ReadDnsName(const std::vector<std::uint8_t> &packet, std::size_t &offset, std::string &out);

    // NetBIOS node status request for the wildcard name "*".
    std::vector<std::uint8_t> BuildNbstatQuery(std::uint16_t transactionId);

    // First unique workstation name (suffix 0x00) of a node status response.
    std::optional<std::string> ParseNbstatResponse(const std::vector<std::uint8_t> &packet);

    // Reverse PTR question; `unicastResponse` sets the mDNS QU bit.
    std::vector<std::uint8_t> BuildPtrQuery(std::uint16_t transactionId, const Ipv4Address &address,
                                            bool unicastResponse);

    // First PTR answer with a trailing dot and ".local" suffix removed.
    std::optional<std::string> ParsePtrResponse(const std::vector<std::uint8_t> &packet);
}
