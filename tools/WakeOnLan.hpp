#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../common/MacAddress.hpp"

namespace lan_recon::tools
{
    inline constexpr uint16_t WOL_PORT = 9;
    inline constexpr size_t MAGIC_PACKET_SIZE = 102;

    enum class WakeStatus
    {
        Sent,
        InvalidAddress,
        SendError
    };

    std::string ToString(WakeStatus status);

    class DatagramSender
    {
    public:
        virtual ~DatagramSender() = default;
        virtual bool SendBroadcast(const std::vector<uint8_t> &payload, const std::string &address, uint16_t port) = 0;
    };

    class UdpBroadcastSender : public DatagramSender
    {
    public:
        bool SendBroadcast(const std::vector<uint8_t> &payload, const std::string &address, uint16_t port) override;
    };

    // 6 x 0xFF followed by the hardware address repeated 16 times.
    std::vector<uint8_t> BuildMagicPacket(const common::HardwareAddress &mac);

    class WakeOnLan
    {
    public:
        explicit WakeOnLan(std::shared_ptr<DatagramSender> sender,
                           std::string broadcastAddress = "255.255.255.255",
                           uint16_t port = WOL_PORT);

        WakeStatus Wake(const std::string &hardwareAddress);

    private:
        std::shared_ptr<DatagramSender> m_sender;
        std::string m_broadcastAddress;
        uint16_t m_port;
    };
}
