#include "NameQueryCodec.hpp"

namespace lan_recon::common::wire
{
    namespace
    {
        constexpr std::size_t DNS_HEADER_SIZE = 12;
        constexpr std::size_t NBSTAT_ENTRY_SIZE = 18;
        constexpr int MAX_POINTER_JUMPS = 16;

        void AppendHeader(std::vector<std::uint8_t> &out, std::uint16_t id, std::uint16_t flags)
        {
            append_u16_be(out, id);
            append_u16_be(out, flags);
            append_u16_be(out, 1); // qdcount
            append_u16_be(out, 0);
            append_u16_be(out, 0);
            append_u16_be(out, 0);
        }

        bool SkipQuestions(const std::vector<std::uint8_t> &packet, std::size_t &offset, std::uint16_t count)
        {
            for (std::uint16_t i = 0; i < count; ++i)
            {
                std::string ignored;
                if (!ReadDnsName(packet, offset, ignored))
                    return false;
                if (offset + 4 > packet.size())
                    return false;
                offset += 4;
            }
            return true;
        }

        std::string TrimRight(std::string s)
        {
            while (!s.empty() && (s.back() == ' ' || s.back() == '\0'))
                s.pop_back();
            return s;
        }
    }

    std::string ReverseName(const Ipv4Address &address)
    {
        return std::to_string(address.Octet(3)) + "." + std::to_string(address.Octet(2)) + "." +
               std::to_string(address.Octet(1)) + "." + std::to_string(address.Octet(0)) + ".in-addr.arpa";
    }

    bool EncodeDnsName(const std::string &name, std::vector<std::uint8_t> &out)
    {
        std::size_t start = 0;
        while (start < name.size())
        {
            std::size_t dot = name.find('.', start);
            if (dot == std::string::npos)
                dot = name.size();

            std::size_t len = dot - start;
            if (len == 0 || len > 63)
                return false;

            out.push_back(static_cast<std::uint8_t>(len));
            out.insert(out.end(), name.begin() + start, name.begin() + dot);
            start = dot + 1;
        }
        out.push_back(0x00);
        return true;
    }

    bool ReadDnsName(const std::vector<std::uint8_t> &packet, std::size_t &offset, std::string &out)
    {
        std::size_t pos = offset;
        bool jumped = false;
        int jumps = 0;
        out.clear();

        while (true)
        {
            if (pos >= packet.size())
                return false;

            std::uint8_t len = packet[pos];
            if (len == 0)
            {
                ++pos;
                break;
            }

            if ((len & 0xC0) == 0xC0)
            {
                if (pos + 1 >= packet.size() || ++jumps > MAX_POINTER_JUMPS)
                    return false;
                std::size_t target = (static_cast<std::size_t>(len & 0x3F) << 8) | packet[pos + 1];
                if (!jumped)
                    offset = pos + 2;
                jumped = true;
                pos = target;
                continue;
            }

            if (pos + 1 + len > packet.size())
                return false;
            if (!out.empty())
                out += '.';
            out.append(reinterpret_cast<const char *>(packet.data() + pos + 1), len);
            pos += 1 + len;
        }

        if (!jumped)
            offset = pos;
        return true;
    }

    std::vector<std::uint8_t> BuildNbstatQuery(std::uint16_t transactionId)
    {
        std::vector<std::uint8_t> packet;
        AppendHeader(packet, transactionId, 0x0000);

        // First-level encoding of "*" padded with NULs: 'C','K' then "AA" x 15.
        packet.push_back(0x20);
        packet.push_back('C');
        packet.push_back('K');
        for (int i = 0; i < 30; ++i)
            packet.push_back('A');
        packet.push_back(0x00);

        append_u16_be(packet, NBSTAT_TYPE);
        append_u16_be(packet, 0x0001);
        return packet;
    }

    std::optional<std::string> ParseNbstatResponse(const std::vector<std::uint8_t> &packet)
    {
        if (packet.size() < DNS_HEADER_SIZE)
            return std::nullopt;

        std::size_t offset = 4;
        std::uint16_t qdcount = 0;
        std::uint16_t ancount = 0;
        read_u16_be(packet, offset, qdcount);
        read_u16_be(packet, offset, ancount);
        if (ancount == 0)
            return std::nullopt;

        offset = DNS_HEADER_SIZE;
        if (!SkipQuestions(packet, offset, qdcount))
            return std::nullopt;

        std::string rrName;
        if (!ReadDnsName(packet, offset, rrName))
            return std::nullopt;

        std::uint16_t type = 0;
        std::uint16_t rrClass = 0;
        if (!read_u16_be(packet, offset, type) || !read_u16_be(packet, offset, rrClass))
            return std::nullopt;
        if (type != NBSTAT_TYPE)
            return std::nullopt;

        offset += 4; // ttl
        std::uint16_t rdlength = 0;
        if (!read_u16_be(packet, offset, rdlength) || offset >= packet.size())
            return std::nullopt;

        std::uint8_t count = packet[offset++];
        for (std::uint8_t i = 0; i < count; ++i)
        {
            if (offset + NBSTAT_ENTRY_SIZE > packet.size())
                return std::nullopt;

            std::string name(reinterpret_cast<const char *>(packet.data() + offset), 15);
            std::uint8_t suffix = packet[offset + 15];
            std::uint16_t flags = static_cast<std::uint16_t>((packet[offset + 16] << 8) | packet[offset + 17]);
            offset += NBSTAT_ENTRY_SIZE;

            bool isGroup = (flags & 0x8000) != 0;
            if (suffix == 0x00 && !isGroup)
            {
                name = TrimRight(name);
                if (!name.empty())
                    return name;
            }
        }
        return std::nullopt;
    }

    std::vector<std::uint8_t> BuildPtrQuery(std::uint16_t transactionId, const Ipv4Address &address,
                                            bool unicastResponse)
    {
        std::vector<std::uint8_t> packet;
        AppendHeader(packet, transactionId, 0x0000);
        EncodeDnsName(ReverseName(address), packet);
        append_u16_be(packet, DNS_TYPE_PTR);
        append_u16_be(packet, unicastResponse ? 0x8001 : 0x0001);
        return packet;
    }

    std::optional<std::string> ParsePtrResponse(const std::vector<std::uint8_t> &packet)
    {
        if (packet.size() < DNS_HEADER_SIZE)
            return std::nullopt;

        std::size_t offset = 2;
        std::uint16_t flags = 0;
        std::uint16_t qdcount = 0;
        std::uint16_t ancount = 0;
        read_u16_be(packet, offset, flags);
        read_u16_be(packet, offset, qdcount);
        read_u16_be(packet, offset, ancount);
        if ((flags & 0x8000) == 0 || ancount == 0)
            return std::nullopt;

        offset = DNS_HEADER_SIZE;
        if (!SkipQuestions(packet, offset, qdcount))
            return std::nullopt;

        for (std::uint16_t i = 0; i < ancount; ++i)
        {
            std::string rrName;
            if (!ReadDnsName(packet, offset, rrName))
                return std::nullopt;

            std::uint16_t type = 0;
            std::uint16_t rrClass = 0;
            std::uint16_t rdlength = 0;
            if (!read_u16_be(packet, offset, type) || !read_u16_be(packet, offset, rrClass))
                return std::nullopt;
            offset += 4; // ttl
            if (!read_u16_be(packet, offset, rdlength) || offset + rdlength > packet.size())
                return std::nullopt;

            if (type == DNS_TYPE_PTR)
            {
                std::size_t rdata = offset;
                std::string target;
                if (!ReadDnsName(packet, rdata, target) || target.empty())
                    return std::nullopt;

                const std::string localSuffix = ".local";
                if (!target.empty() && target.back() == '.')
                    target.pop_back();
                if (target.size() > localSuffix.size() &&
                    target.compare(target.size() - localSuffix.size(), localSuffix.size(), localSuffix) == 0)
                    target.erase(target.size() - localSuffix.size());
                return target;
            }
            offset += rdlength;
        }
        return std::nullopt;
    }
}
