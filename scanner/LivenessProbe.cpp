#include "LivenessProbe.hpp"
#include "PortScanner.hpp"
#include <atomic>
#include <iostream>
#include <memory>
#include <tins/tins.h>

namespace lan_recon::scanner
{
    namespace
    {
        std::atomic<uint16_t> g_icmp_sequence{1};
    }

    ProbeSettings ProbeSettings::Light()
    {
        ProbeSettings settings;
        settings.ports = {80, 443, 22, 62078};
        settings.connectTimeout = std::chrono::milliseconds(250);
        settings.icmpTimeout = std::chrono::milliseconds(400);
        // A STALE neighbor entry keeps its complete flag long after the host left.
        settings.useNeighborTable = false;
        return settings;
    }

    LivenessProbe::LivenessProbe(std::shared_ptr<NeighborSource> neighbors)
        : m_neighbors(std::move(neighbors))
    {
    }

    bool LivenessProbe::IsAlive(const common::Ipv4Address &address, const ProbeSettings &settings)
    {
        try
        {
            for (uint16_t port : settings.ports)
            {
                // A reset also proves the host is up.
                ConnectOutcome outcome = TcpConnect(address, port, settings.connectTimeout);
                if (outcome == ConnectOutcome::Open || outcome == ConnectOutcome::Refused)
                    return true;
            }

            if (settings.useIcmp && IcmpEcho(address, settings.icmpTimeout))
                return true;

            if (settings.useNeighborTable && m_neighbors)
            {
                auto entry = m_neighbors->Lookup(address);
                if (entry && entry->complete)
                    return true;
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[LivenessProbe] " << address.ToString() << ": " << e.what() << "\n";
        }
        return false;
    }

    bool LivenessProbe::IcmpEcho(const common::Ipv4Address &address, std::chrono::milliseconds timeout)
    {
        try
        {
            auto millis = timeout.count();
            Tins::PacketSender sender(Tins::NetworkInterface(),
                                      static_cast<uint32_t>(millis / 1000),
                                      static_cast<uint32_t>((millis % 1000) * 1000));

            Tins::IP ip = Tins::IP(address.ToString()) / Tins::ICMP();
            Tins::ICMP &icmp = ip.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(0x4C52);
            icmp.sequence(g_icmp_sequence++);

            std::unique_ptr<Tins::PDU> reply(sender.send_recv(ip));
            if (!reply)
                return false;

            const Tins::ICMP *answer = reply->find_pdu<Tins::ICMP>();
            return answer && answer->type() == Tins::ICMP::ECHO_REPLY;
        }
        catch (const std::exception &)
        {
            // Raw sockets need privilege; treat as no answer.
            return false;
        }
    }
}
