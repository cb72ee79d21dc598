#include "PortScanner.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lan_recon::scanner
{
    namespace
    {
        const std::map<uint16_t, std::string> SERVICES = {
            {21, "FTP"}, {22, "SSH"}, {23, "Telnet"}, {25, "SMTP"}, {53, "DNS"},
            {80, "HTTP"}, {110, "POP3"}, {111, "RPCbind"}, {135, "MSRPC"}, {139, "NetBIOS"},
            {143, "IMAP"}, {443, "HTTPS"}, {445, "SMB"}, {515, "LPD"}, {548, "AFP"},
            {554, "RTSP"}, {587, "Submission"}, {631, "IPP"}, {993, "IMAPS"}, {995, "POP3S"},
            {1433, "MSSQL"}, {1883, "MQTT"}, {1900, "UPnP"}, {2049, "NFS"}, {3306, "MySQL"},
            {3389, "RDP"}, {5000, "UPnP/Synology"}, {5001, "Synology-HTTPS"}, {5432, "PostgreSQL"},
            {5683, "CoAP"}, {5900, "VNC"}, {6379, "Redis"}, {7000, "AirPlay"}, {8000, "HTTP-Alt"},
            {8008, "Chromecast"}, {8009, "Chromecast-TLS"}, {8080, "HTTP-Alt"}, {8443, "HTTPS-Alt"},
            {8554, "RTSP-Alt"}, {8883, "MQTT-TLS"}, {9100, "JetDirect"}, {27017, "MongoDB"},
            {32400, "Plex"}, {34567, "DVR"}, {37777, "Dahua"}, {62078, "iPhone-Sync"},
        };

        void FillAddress(const common::Ipv4Address &address, uint16_t port, sockaddr_in &out)
        {
            std::memset(&out, 0, sizeof(out));
            out.sin_family = AF_INET;
            out.sin_port = htons(port);
            out.sin_addr.s_addr = htonl(address.Value());
        }

        int OpenNonBlocking()
        {
            int fd = socket(AF_INET, SOCK_STREAM, 0);
            if (fd < 0)
                return -1;
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
            {
                close(fd);
                return -1;
            }
            return fd;
        }

        int SocketError(int fd)
        {
            int err = 0;
            socklen_t len = sizeof(err);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0)
                return errno;
            return err;
        }
    }

    ConnectOutcome TcpConnect(const common::Ipv4Address &address, uint16_t port,
                              std::chrono::milliseconds timeout)
    {
        int fd = OpenNonBlocking();
        if (fd < 0)
            return ConnectOutcome::Error;

        sockaddr_in addr;
        FillAddress(address, port, addr);

        ConnectOutcome outcome = ConnectOutcome::Error;
        int r = connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
        if (r == 0)
        {
            outcome = ConnectOutcome::Open;
        }
        else if (errno == ECONNREFUSED)
        {
            outcome = ConnectOutcome::Refused;
        }
        else if (errno == EINPROGRESS)
        {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;

            int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (ready == 0)
            {
                outcome = ConnectOutcome::Timeout;
            }
            else if (ready > 0)
            {
                int err = SocketError(fd);
                if (err == 0)
                    outcome = ConnectOutcome::Open;
                else if (err == ECONNREFUSED)
                    outcome = ConnectOutcome::Refused;
            }
        }

        close(fd);
        return outcome;
    }

    std::vector<uint16_t> ScanPorts(const common::Ipv4Address &address,
                                    const std::vector<uint16_t> &ports,
                                    std::chrono::milliseconds timeout,
                                    size_t batchSize)
    {
        std::vector<uint16_t> open;
        if (batchSize == 0)
            batchSize = 1;

        for (size_t offset = 0; offset < ports.size(); offset += batchSize)
        {
            size_t end = std::min(offset + batchSize, ports.size());

            std::vector<pollfd> pfds;
            std::vector<uint16_t> pending;
            std::vector<int> fds;

            for (size_t i = offset; i < end; ++i)
            {
                int fd = OpenNonBlocking();
                if (fd < 0)
                    continue;

                sockaddr_in addr;
                FillAddress(address, ports[i], addr);
                int r = connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
                if (r == 0)
                {
                    open.push_back(ports[i]);
                    close(fd);
                    continue;
                }
                if (errno != EINPROGRESS)
                {
                    close(fd);
                    continue;
                }

                pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLOUT;
                pfds.push_back(pfd);
                pending.push_back(ports[i]);
                fds.push_back(fd);
            }

            auto deadline = std::chrono::steady_clock::now() + timeout;
            size_t remaining = pfds.size();
            while (remaining > 0)
            {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (left.count() <= 0)
                    break;

                int n = poll(pfds.data(), pfds.size(), static_cast<int>(left.count()));
                if (n <= 0)
                    break;

                for (size_t i = 0; i < pfds.size(); ++i)
                {
                    if (pfds[i].fd < 0 || pfds[i].revents == 0)
                        continue;
                    if (SocketError(pfds[i].fd) == 0)
                        open.push_back(pending[i]);
                    pfds[i].fd = -1;
                    --remaining;
                }
            }

            for (int fd : fds)
                close(fd);
        }

        std::sort(open.begin(), open.end());
        open.erase(std::unique(open.begin(), open.end()), open.end());
        return open;
    }

    std::string ServiceName(uint16_t port)
    {
        auto it = SERVICES.find(port);
        if (it == SERVICES.end())
            return "Unknown";
        return it->second;
    }

    const std::vector<uint16_t> &CommonPorts()
    {
        static const std::vector<uint16_t> ports = {
            21, 22, 23, 25, 53, 80, 110, 143, 443, 445, 993, 995,
            3306, 3389, 5432, 5900, 6379, 8080, 8443, 27017};
        return ports;
    }
}
