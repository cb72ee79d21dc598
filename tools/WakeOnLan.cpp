#include "WakeOnLan.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lan_recon::tools
{
    std::string ToString(WakeStatus status)
    {
        switch (status)
        {
        case WakeStatus::Sent:
            return "Sent";
        case WakeStatus::InvalidAddress:
            return "InvalidAddress";
        case WakeStatus::SendError:
            return "SendError";
        }
        return "Unknown";
    }

    bool UdpBroadcastSender::SendBroadcast(const std::vector<uint8_t> &payload, const std::string &address, uint16_t port)
    {
        struct sockaddr_in dest;
        std::memset(&dest, 0, sizeof(dest));
        dest.sin_family = AF_INET;
        dest.sin_port = htons(port);
        if (inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1)
        {
            std::cerr << "[WakeOnLan] Bad broadcast address " << address << "\n";
            return false;
        }

        int sockfd = socket(AF_INET, SOCK_DGRAM, 0);
        if (sockfd < 0)
        {
            std::cerr << "[WakeOnLan] socket failed: " << std::strerror(errno) << "\n";
            return false;
        }

        int enable = 1;
        if (setsockopt(sockfd, SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable)) < 0)
        {
            std::cerr << "[WakeOnLan] SO_BROADCAST failed: " << std::strerror(errno) << "\n";
            close(sockfd);
            return false;
        }

        ssize_t sent = sendto(sockfd, payload.data(), payload.size(), 0,
                              reinterpret_cast<const struct sockaddr *>(&dest), sizeof(dest));
        close(sockfd);
        return sent == static_cast<ssize_t>(payload.size());
    }

    std::vector<uint8_t> BuildMagicPacket(const common::HardwareAddress &mac)
    {
        std::vector<uint8_t> packet(6, 0xFF);
        packet.reserve(MAGIC_PACKET_SIZE);
        for (int i = 0; i < 16; ++i)
            packet.insert(packet.end(), mac.begin(), mac.end());
        return packet;
    }

    WakeOnLan::WakeOnLan(std::shared_ptr<DatagramSender> sender, std::string broadcastAddress, uint16_t port)
        : m_sender(std::move(sender)), m_broadcastAddress(std::move(broadcastAddress)), m_port(port)
    {
    }

    WakeStatus WakeOnLan::Wake(const std::string &hardwareAddress)
    {
        auto mac = common::ParseMac(hardwareAddress);
        if (!mac)
            return WakeStatus::InvalidAddress;

        if (!m_sender || !m_sender->SendBroadcast(BuildMagicPacket(*mac), m_broadcastAddress, m_port))
            return WakeStatus::SendError;
        return WakeStatus::Sent;
    }
}
