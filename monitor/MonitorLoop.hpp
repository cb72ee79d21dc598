#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "../common/CancellationToken.hpp"
#include "../common/HostRecord.hpp"
#include "../scanner/DiscoveryOrchestrator.hpp"
#include "../scanner/EnrichmentResolver.hpp"

namespace lan_recon::monitor
{
    enum class MonitorState
    {
        Idle,
        Scanning,
        Diffing,
        Sleeping,
        Stopped
    };

    enum class MonitorEventType
    {
        Joined,
        Left,
        Error
    };

    struct MonitorEvent
    {
        MonitorEventType type;
        common::HostRecord record;
        std::string message;
    };

    using MonitorCallback = std::function<void(const MonitorEvent &event)>;

    std::string ToString(MonitorEventType type);

    class MonitorLoop
    {
    public:
        // A null `token` gives the loop a private one that only Stop() cancels.
        // Addresses in `exclude` are neither probed nor reported.
        MonitorLoop(std::shared_ptr<scanner::SegmentScanner> scanner,
                    std::shared_ptr<scanner::HostEnricher> enricher,
                    common::Segment segment,
                    common::Ipv4Address localAddress,
                    common::AddressSet exclude,
                    scanner::ScanOptions options = scanner::ScanOptions::Light(),
                    std::chrono::milliseconds interval = std::chrono::seconds(5),
                    std::shared_ptr<common::CancellationToken> token = nullptr);
        ~MonitorLoop();

        void Start(MonitorCallback callback);
        void Stop();

        // One Scanning + Diffing step. The first call only records the baseline.
        std::vector<MonitorEvent> RunCycle();

        MonitorState State() const { return m_state; }
        common::KnownHostSet Known() const;

    private:
        void Run();
        void Dispatch(const std::vector<MonitorEvent> &events);
        common::HostRecord Describe(const common::Ipv4Address &address);

        std::shared_ptr<scanner::SegmentScanner> m_scanner;
        std::shared_ptr<scanner::HostEnricher> m_enricher;
        common::Segment m_segment;
        common::Ipv4Address m_localAddress;
        common::AddressSet m_exclude;
        scanner::ScanOptions m_options;
        std::chrono::milliseconds m_interval;
        std::shared_ptr<common::CancellationToken> m_token;

        MonitorCallback m_callback;
        std::atomic<MonitorState> m_state;
        std::thread m_thread;

        mutable std::mutex m_mutex;
        common::KnownHostSet m_known;
        bool m_hasBaseline = false;
    };
}
