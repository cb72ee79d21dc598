#include "FingerprintEngine.hpp"
#include "PortScanner.hpp"
#include <algorithm>
#include <set>

namespace lan_recon::scanner
{
    namespace
    {
        const char *MOBILE_DEVICE = "Mobile Device";
        const char *STEALTH = "Stealth/Firewall";

        bool Contains(const std::vector<uint16_t> &ports, uint16_t port)
        {
            return std::find(ports.begin(), ports.end(), port) != ports.end();
        }
    }

    const std::vector<DeviceSignature> &Signatures()
    {
        static const std::vector<DeviceSignature> signatures = {
            {"Router/Gateway", {53, 80, 443, 1900, 8080}},
            {"Web Server", {80, 443, 8000, 8080, 8443}},
            {"NAS/File Server", {139, 445, 548, 2049, 5000, 5001}},
            {"Printer", {515, 631, 9100}},
            {"IP Camera", {554, 8554, 37777, 34567}},
            {"Media/Smart TV", {7000, 8008, 8009, 32400}},
            {"Windows PC", {135, 139, 445, 3389}},
            {"Linux/Unix Host", {22, 111}},
            {"Database Server", {1433, 3306, 5432, 6379, 27017}},
            {"Mail Server", {25, 110, 143, 587, 993, 995}},
            {"IoT Hub", {1883, 5683, 8883}},
        };
        return signatures;
    }

    const std::vector<uint16_t> &ProbePorts()
    {
        static const std::vector<uint16_t> ports = []
        {
            std::set<uint16_t> all = {21, 23, 3389, 5900};
            for (const auto &signature : Signatures())
                all.insert(signature.ports.begin(), signature.ports.end());
            return std::vector<uint16_t>(all.begin(), all.end());
        }();
        return ports;
    }

    std::string Classify(const common::HostRecord &record, const std::vector<uint16_t> &openPorts)
    {
        const DeviceSignature *best = nullptr;
        size_t bestScore = 0;

        for (const auto &signature : Signatures())
        {
            size_t score = 0;
            for (uint16_t port : signature.ports)
            {
                if (Contains(openPorts, port))
                    ++score;
            }

            // Strictly greater keeps the first-declared signature on ties.
            if (score > bestScore)
            {
                bestScore = score;
                best = &signature;
            }
        }

        if (best)
            return best->label;
        return record.hasRandomizedHardwareAddress ? MOBILE_DEVICE : STEALTH;
    }

    std::vector<std::string> SecurityWarnings(const std::vector<uint16_t> &openPorts)
    {
        std::vector<std::string> warnings;
        if (Contains(openPorts, 23))
            warnings.push_back("Telnet (23) is open: credentials travel in cleartext");
        if (Contains(openPorts, 21))
            warnings.push_back("FTP (21) is open: consider SFTP instead");
        if (Contains(openPorts, 3389))
            warnings.push_back("RDP (3389) is exposed: restrict it to trusted hosts");
        if (Contains(openPorts, 5900))
            warnings.push_back("VNC (5900) is exposed: make sure it requires a password");
        return warnings;
    }

    void FingerprintEngine::Fingerprint(common::HostRecord &record) const
    {
        record.openPorts = ScanPorts(record.address, ProbePorts(), m_timeout);
        record.deviceType = Classify(record, record.openPorts);
    }
}
