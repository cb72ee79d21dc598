#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "../common/Ipv4Address.hpp"

namespace lan_recon::scanner
{
    enum class ConnectOutcome
    {
        Open,
        Refused,
        Timeout,
        Error
    };

    // Single non-blocking connect bounded by `timeout`.
    ConnectOutcome TcpConnect(const common::Ipv4Address &address, uint16_t port,
                              std::chrono::milliseconds timeout);

    // Connects to `ports` in batches and returns the open ones in ascending order.
    std::vector<uint16_t> ScanPorts(const common::Ipv4Address &address,
                                    const std::vector<uint16_t> &ports,
                                    std::chrono::milliseconds timeout,
                                    size_t batchSize = 64);

    // "SSH", "HTTPS", ... or "Unknown".
    std::string ServiceName(uint16_t port);

    const std::vector<uint16_t> &CommonPorts();
}
