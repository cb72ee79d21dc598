#include "MacAddress.hpp"
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <vector>

namespace lan_recon::common
{
    namespace
    {
        int HexValue(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            return -1;
        }

        bool DecodeHex(const std::string &digits, std::vector<uint8_t> &out)
        {
            if (digits.empty() || digits.size() % 2 != 0)
                return false;
            for (size_t i = 0; i < digits.size(); i += 2)
            {
                int hi = HexValue(digits[i]);
                int lo = HexValue(digits[i + 1]);
                if (hi < 0 || lo < 0)
                    return false;
                out.push_back(static_cast<uint8_t>((hi << 4) | lo));
            }
            return true;
        }

        std::vector<std::string> Split(const std::string &text, char sep)
        {
            std::vector<std::string> parts;
            std::string current;
            for (char c : text)
            {
                if (c == sep)
                {
                    parts.push_back(current);
                    current.clear();
                }
                else
                {
                    current += c;
                }
            }
            parts.push_back(current);
            return parts;
        }
    }

    std::optional<HardwareAddress> ParseMac(const std::string &text)
    {
        std::vector<uint8_t> bytes;

        char sep = 0;
        if (text.find(':') != std::string::npos)
            sep = ':';
        else if (text.find('-') != std::string::npos)
            sep = '-';

        if (sep != 0)
        {
            auto groups = Split(text, sep);
            if (groups.size() != 6)
                return std::nullopt;
            for (auto &group : groups)
            {
                if (group.empty() || group.size() > 2)
                    return std::nullopt;
                if (group.size() == 1)
                    group = "0" + group;
                if (!DecodeHex(group, bytes))
                    return std::nullopt;
            }
        }
        else if (text.find('.') != std::string::npos)
        {
            auto groups = Split(text, '.');
            if (groups.size() != 3)
                return std::nullopt;
            for (const auto &group : groups)
            {
                if (group.size() != 4 || !DecodeHex(group, bytes))
                    return std::nullopt;
            }
        }
        else
        {
            if (text.size() != 12 || !DecodeHex(text, bytes))
                return std::nullopt;
        }

        if (bytes.size() != 6)
            return std::nullopt;
        return HardwareAddress(bytes.data());
    }

    std::string FormatMac(const HardwareAddress &mac)
    {
        return mac.to_string();
    }

    std::string OuiPrefix(const HardwareAddress &mac)
    {
        std::ostringstream ss;
        ss << std::uppercase << std::hex << std::setfill('0');
        for (size_t i = 0; i < 3; ++i)
        {
            if (i > 0)
                ss << ':';
            ss << std::setw(2) << static_cast<int>(mac[i]);
        }
        return ss.str();
    }

    bool IsZeroMac(const HardwareAddress &mac)
    {
        for (auto byte : mac)
        {
            if (byte != 0)
                return false;
        }
        return true;
    }

    bool IsLocallyAdministered(const HardwareAddress &mac)
    {
        return (mac[0] & 0x02) != 0;
    }
}
