#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lan_recon::common
{
    class Ipv4Address
    {
    public:
        Ipv4Address() = default;
        explicit Ipv4Address(uint32_t value) : m_value(value) {}

        static std::optional<Ipv4Address> Parse(const std::string &text);

        uint32_t Value() const { return m_value; }
        uint8_t Octet(int index) const;
        std::string ToString() const;

        bool operator==(const Ipv4Address &other) const { return m_value == other.m_value; }
        bool operator!=(const Ipv4Address &other) const { return m_value != other.m_value; }
        bool operator<(const Ipv4Address &other) const { return m_value < other.m_value; }

    private:
        uint32_t m_value = 0;
    };

    // A /24-equivalent local segment, identified by its first three octets.
    class Segment
    {
    public:
        static constexpr int FIRST_HOST = 1;
        static constexpr int LAST_HOST = 254;

        Segment() = default;
        explicit Segment(const Ipv4Address &anyMember);

        // Accepts "192.168.1", "192.168.1.0", "192.168.1.17" or "192.168.1.0/24".
        static std::optional<Segment> Parse(const std::string &text);

        Ipv4Address Host(int octet) const;
        std::vector<Ipv4Address> Hosts() const;
        bool Contains(const Ipv4Address &address) const;

        std::string Prefix() const;
        std::string Cidr() const;

        bool operator==(const Segment &other) const { return m_network == other.m_network; }

    private:
        uint32_t m_network = 0;
    };

    struct SubnetInfo
    {
        Ipv4Address address;
        int prefixLength = 0;
        Ipv4Address mask;
        Ipv4Address wildcard;
        Ipv4Address network;
        Ipv4Address broadcast;
        Ipv4Address firstHost;
        Ipv4Address lastHost;
        uint64_t totalHosts = 0;
        std::string addressClass;
        bool isPrivate = false;
    };

    // Throws std::invalid_argument for a prefix length outside 0..32.
    SubnetInfo CalculateSubnet(const Ipv4Address &address, int prefixLength);

    // "10.0.0.7/8" or a bare address (defaults to /24).
    SubnetInfo CalculateSubnet(const std::string &cidr);

    std::string AddressClass(const Ipv4Address &address);
    bool IsPrivateAddress(const Ipv4Address &address);
}
