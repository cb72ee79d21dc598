#include "NameResolvers.hpp"
#include "../common/NameQueryCodec.hpp"
#include <arpa/inet.h>
#include <atomic>
#include <cstring>
#include <fstream>
#include <netdb.h>
#include <netinet/in.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace lan_recon::scanner
{
    namespace
    {
        std::atomic<uint16_t> g_transaction_id{0x3A00};

        // One request, one reply from the same host, bounded by `timeout`.
        std::optional<std::vector<uint8_t>> UdpExchange(const common::Ipv4Address &address, uint16_t port,
                                                        const std::vector<uint8_t> &request,
                                                        std::chrono::milliseconds timeout)
        {
            int sockfd = socket(AF_INET, SOCK_DGRAM, 0);
            if (sockfd < 0)
                return std::nullopt;

            struct timeval tv;
            tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
            tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
            setsockopt(sockfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof tv);

            struct sockaddr_in servaddr;
            std::memset(&servaddr, 0, sizeof(servaddr));
            servaddr.sin_family = AF_INET;
            servaddr.sin_port = htons(port);
            servaddr.sin_addr.s_addr = htonl(address.Value());

            ssize_t sent = sendto(sockfd, request.data(), request.size(), 0,
                                  reinterpret_cast<const struct sockaddr *>(&servaddr), sizeof(servaddr));
            if (sent != static_cast<ssize_t>(request.size()))
            {
                close(sockfd);
                return std::nullopt;
            }

            uint8_t buffer[1500];
            struct sockaddr_in from;
            socklen_t len = sizeof(from);
            ssize_t n = recvfrom(sockfd, buffer, sizeof(buffer), 0, reinterpret_cast<struct sockaddr *>(&from), &len);
            close(sockfd);

            if (n <= 0 || ntohl(from.sin_addr.s_addr) != address.Value())
                return std::nullopt;
            return std::vector<uint8_t>(buffer, buffer + n);
        }

        bool SameTransaction(const std::vector<uint8_t> &reply, uint16_t id)
        {
            return reply.size() >= 2 && reply[0] == ((id >> 8) & 0xFF) && reply[1] == (id & 0xFF);
        }
    }

    std::optional<std::string> ReverseDnsSource::Resolve(const common::Ipv4Address &address)
    {
        struct sockaddr_in sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sin_family = AF_INET;
        sa.sin_addr.s_addr = htonl(address.Value());

        char host[NI_MAXHOST];
        int rc = getnameinfo(reinterpret_cast<struct sockaddr *>(&sa), sizeof(sa), host, sizeof(host),
                             nullptr, 0, NI_NAMEREQD);
        if (rc != 0)
            return std::nullopt;
        return std::string(host);
    }

    std::optional<std::string> NetBiosSource::Resolve(const common::Ipv4Address &address)
    {
        uint16_t id = g_transaction_id++;
        auto reply = UdpExchange(address, common::wire::NETBIOS_NS_PORT,
                                 common::wire::BuildNbstatQuery(id), m_timeout);
        if (!reply || !SameTransaction(*reply, id))
            return std::nullopt;
        return common::wire::ParseNbstatResponse(*reply);
    }

    std::optional<std::string> MdnsSource::Resolve(const common::Ipv4Address &address)
    {
        uint16_t id = g_transaction_id++;
        auto reply = UdpExchange(address, common::wire::MDNS_PORT,
                                 common::wire::BuildPtrQuery(id, address, true), m_timeout);
        if (!reply || !SameTransaction(*reply, id))
            return std::nullopt;
        return common::wire::ParsePtrResponse(*reply);
    }

    std::optional<std::string> LookupHostsText(const std::string &text, const common::Ipv4Address &address)
    {
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line))
        {
            auto hash = line.find('#');
            if (hash != std::string::npos)
                line.erase(hash);

            std::istringstream ss(line);
            std::string ip, name;
            if (!(ss >> ip >> name))
                continue;

            auto parsed = common::Ipv4Address::Parse(ip);
            if (parsed && *parsed == address)
                return name;
        }
        return std::nullopt;
    }

    std::optional<std::string> HostsFileSource::Resolve(const common::Ipv4Address &address)
    {
        std::ifstream file(m_path);
        if (!file.is_open())
            return std::nullopt;

        std::stringstream buffer;
        buffer << file.rdbuf();
        return LookupHostsText(buffer.str(), address);
    }

    std::optional<std::string> NeighborNameSource::Resolve(const common::Ipv4Address &address)
    {
        if (!m_neighbors)
            return std::nullopt;
        auto entry = m_neighbors->Lookup(address);
        if (!entry || entry->name.empty())
            return std::nullopt;
        return entry->name;
    }

    std::optional<std::string> TopologyPtrSource::Resolve(const common::Ipv4Address &address)
    {
        if (!m_topology)
            return std::nullopt;
        return m_topology->PtrName(address);
    }

    HostnameChain DefaultHostnameChain(std::shared_ptr<NeighborSource> neighbors,
                                       std::shared_ptr<BulkDiscovery> topology,
                                       std::chrono::milliseconds queryTimeout)
    {
        HostnameChain chain;
        chain.push_back(std::make_shared<ReverseDnsSource>());
        chain.push_back(std::make_shared<NetBiosSource>(queryTimeout));
        chain.push_back(std::make_shared<MdnsSource>(queryTimeout));
        chain.push_back(std::make_shared<HostsFileSource>());
        chain.push_back(std::make_shared<NeighborNameSource>(std::move(neighbors)));
        chain.push_back(std::make_shared<TopologyPtrSource>(std::move(topology)));
        return chain;
    }
}
