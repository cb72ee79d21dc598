#include "Ipv4Address.hpp"
#include <arpa/inet.h>
#include <stdexcept>

namespace lan_recon::common
{
    std::optional<Ipv4Address> Ipv4Address::Parse(const std::string &text)
    {
        struct in_addr addr;
        if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
            return std::nullopt;
        return Ipv4Address(ntohl(addr.s_addr));
    }

    uint8_t Ipv4Address::Octet(int index) const
    {
        if (index < 0 || index > 3)
            throw std::out_of_range("Ipv4Address::Octet - index must be 0..3");
        return static_cast<uint8_t>((m_value >> (24 - 8 * index)) & 0xFF);
    }

    std::string Ipv4Address::ToString() const
    {
        return std::to_string(Octet(0)) + "." + std::to_string(Octet(1)) + "." +
               std::to_string(Octet(2)) + "." + std::to_string(Octet(3));
    }

    Segment::Segment(const Ipv4Address &anyMember)
        : m_network(anyMember.Value() & 0xFFFFFF00)
    {
    }

    std::optional<Segment> Segment::Parse(const std::string &text)
    {
        std::string base = text;
        auto slash = base.find('/');
        if (slash != std::string::npos)
        {
            if (base.substr(slash + 1) != "24")
                return std::nullopt;
            base = base.substr(0, slash);
        }

        int dots = 0;
        for (char c : base)
        {
            if (c == '.')
                ++dots;
        }
        if (dots == 2)
            base += ".0";

        auto address = Ipv4Address::Parse(base);
        if (!address)
            return std::nullopt;
        return Segment(*address);
    }

    Ipv4Address Segment::Host(int octet) const
    {
        if (octet < 0 || octet > 255)
            throw std::out_of_range("Segment::Host - octet must be 0..255");
        return Ipv4Address(m_network | static_cast<uint32_t>(octet));
    }

    std::vector<Ipv4Address> Segment::Hosts() const
    {
        std::vector<Ipv4Address> hosts;
        hosts.reserve(LAST_HOST - FIRST_HOST + 1);
        for (int i = FIRST_HOST; i <= LAST_HOST; ++i)
            hosts.push_back(Host(i));
        return hosts;
    }

    bool Segment::Contains(const Ipv4Address &address) const
    {
        return (address.Value() & 0xFFFFFF00) == m_network;
    }

    std::string Segment::Prefix() const
    {
        Ipv4Address network(m_network);
        return std::to_string(network.Octet(0)) + "." + std::to_string(network.Octet(1)) + "." +
               std::to_string(network.Octet(2));
    }

    std::string Segment::Cidr() const
    {
        return Ipv4Address(m_network).ToString() + "/24";
    }

    SubnetInfo CalculateSubnet(const Ipv4Address &address, int prefixLength)
    {
        if (prefixLength < 0 || prefixLength > 32)
            throw std::invalid_argument("CIDR prefix must be between 0 and 32");

        uint32_t mask = prefixLength == 0 ? 0 : (0xFFFFFFFFu << (32 - prefixLength));
        uint32_t network = address.Value() & mask;
        uint32_t broadcast = network | ~mask;

        SubnetInfo info;
        info.address = address;
        info.prefixLength = prefixLength;
        info.mask = Ipv4Address(mask);
        info.wildcard = Ipv4Address(~mask);
        info.network = Ipv4Address(network);
        info.broadcast = Ipv4Address(broadcast);

        uint64_t blockSize = uint64_t{1} << (32 - prefixLength);
        if (prefixLength < 31)
        {
            info.firstHost = Ipv4Address(network + 1);
            info.lastHost = Ipv4Address(broadcast - 1);
            info.totalHosts = blockSize - 2;
        }
        else
        {
            info.firstHost = info.network;
            info.lastHost = info.broadcast;
            info.totalHosts = blockSize;
        }

        info.addressClass = AddressClass(address);
        info.isPrivate = IsPrivateAddress(address);
        return info;
    }

    SubnetInfo CalculateSubnet(const std::string &cidr)
    {
        std::string ip = cidr;
        int prefixLength = 24;

        auto slash = cidr.find('/');
        if (slash != std::string::npos)
        {
            ip = cidr.substr(0, slash);
            try
            {
                size_t consumed = 0;
                std::string suffix = cidr.substr(slash + 1);
                prefixLength = std::stoi(suffix, &consumed);
                if (consumed != suffix.size())
                    throw std::invalid_argument("trailing characters");
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("Invalid CIDR prefix in '" + cidr + "'");
            }
        }

        auto address = Ipv4Address::Parse(ip);
        if (!address)
            throw std::invalid_argument("Invalid IP address format: '" + ip + "'");

        return CalculateSubnet(*address, prefixLength);
    }

    std::string AddressClass(const Ipv4Address &address)
    {
        int first = address.Octet(0);
        if (first < 128)
            return "Class A";
        if (first < 192)
            return "Class B";
        if (first < 224)
            return "Class C";
        if (first < 240)
            return "Class D (Multicast)";
        return "Class E (Reserved)";
    }

    bool IsPrivateAddress(const Ipv4Address &address)
    {
        int a = address.Octet(0);
        int b = address.Octet(1);
        if (a == 10 || a == 127)
            return true;
        if (a == 172 && b >= 16 && b <= 31)
            return true;
        return a == 192 && b == 168;
    }
}
