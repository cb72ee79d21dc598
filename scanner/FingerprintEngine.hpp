#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "../common/HostRecord.hpp"

namespace lan_recon::scanner
{
    struct DeviceSignature
    {
        std::string label;
        std::vector<uint16_t> ports;
    };

    // Declaration order is the tie-break order.
    const std::vector<DeviceSignature> &Signatures();

    // Union of all signature ports plus FTP, Telnet, RDP and VNC; ascending.
    const std::vector<uint16_t> &ProbePorts();

    std::string Classify(const common::HostRecord &record, const std::vector<uint16_t> &openPorts);

    std::vector<std::string> SecurityWarnings(const std::vector<uint16_t> &openPorts);

    class FingerprintEngine
    {
    public:
        explicit FingerprintEngine(std::chrono::milliseconds timeout = std::chrono::milliseconds(500))
            : m_timeout(timeout) {}

        // Probes ProbePorts() and stores openPorts and deviceType on the record.
        void Fingerprint(common::HostRecord &record) const;

    private:
        std::chrono::milliseconds m_timeout;
    };
}
