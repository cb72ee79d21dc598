#include "MonitorLoop.hpp"
#include <iostream>
#include <stdexcept>

namespace lan_recon::monitor
{
    std::string ToString(MonitorEventType type)
    {
        switch (type)
        {
        case MonitorEventType::Joined:
            return "Joined";
        case MonitorEventType::Left:
            return "Left";
        case MonitorEventType::Error:
            return "Error";
        }
        return "Unknown";
    }

    MonitorLoop::MonitorLoop(std::shared_ptr<scanner::SegmentScanner> scanner,
                             std::shared_ptr<scanner::HostEnricher> enricher,
                             common::Segment segment,
                             common::Ipv4Address localAddress,
                             common::AddressSet exclude,
                             scanner::ScanOptions options,
                             std::chrono::milliseconds interval,
                             std::shared_ptr<common::CancellationToken> token)
        : m_scanner(std::move(scanner)),
          m_enricher(std::move(enricher)),
          m_segment(segment),
          m_localAddress(localAddress),
          m_exclude(std::move(exclude)),
          m_options(options),
          m_interval(interval),
          m_token(token ? std::move(token) : std::make_shared<common::CancellationToken>()),
          m_state(MonitorState::Idle)
    {
        if (!m_scanner)
            throw std::invalid_argument("MonitorLoop requires a segment scanner");
    }

    MonitorLoop::~MonitorLoop()
    {
        Stop();
    }

    void MonitorLoop::Start(MonitorCallback callback)
    {
        if (m_thread.joinable() || m_state == MonitorState::Stopped)
            return;
        m_callback = std::move(callback);
        m_thread = std::thread(&MonitorLoop::Run, this);
    }

    void MonitorLoop::Stop()
    {
        m_token->Cancel();
        if (m_thread.joinable())
            m_thread.join();
        m_state = MonitorState::Stopped;
    }

    common::KnownHostSet MonitorLoop::Known() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_known;
    }

    common::HostRecord MonitorLoop::Describe(const common::Ipv4Address &address)
    {
        common::HostRecord record;
        record.address = address;
        record.isLocalMachine = (address == m_localAddress);
        if (m_enricher && !m_token->IsCancelled())
            m_enricher->Enrich(record);
        return record;
    }

    std::vector<MonitorEvent> MonitorLoop::RunCycle()
    {
        std::vector<MonitorEvent> events;

        m_state = MonitorState::Scanning;
        auto current = m_scanner->ScanAlive(m_segment, m_exclude, m_options, *m_token);
        for (const auto &address : m_exclude)
            current.erase(address);
        current.insert(m_localAddress);

        // A pass cut short by cancellation under-reports and would evict live hosts.
        if (m_token->IsCancelled())
            return events;

        m_state = MonitorState::Diffing;
        bool baseline = false;
        std::vector<common::Ipv4Address> arrivals;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            baseline = !m_hasBaseline;
            for (const auto &address : current)
            {
                if (!m_known.count(address))
                    arrivals.push_back(address);
            }
        }

        // Enriched without the lock so Known() stays responsive.
        std::vector<common::HostRecord> records;
        records.reserve(arrivals.size());
        for (const auto &address : arrivals)
            records.push_back(Describe(address));

        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &record : records)
        {
            m_known.emplace(record.address, record);
            if (!baseline)
                events.push_back({MonitorEventType::Joined, record, ""});
        }

        if (baseline)
        {
            m_hasBaseline = true;
            std::cout << "[Monitor] Baseline: " << m_known.size() << " host(s) on " << m_segment.Cidr() << "\n";
            return events;
        }

        for (auto it = m_known.begin(); it != m_known.end();)
        {
            if (it->first == m_localAddress || current.count(it->first))
            {
                ++it;
                continue;
            }
            events.push_back({MonitorEventType::Left, it->second, ""});
            it = m_known.erase(it);
        }

        return events;
    }

    void MonitorLoop::Dispatch(const std::vector<MonitorEvent> &events)
    {
        if (!m_callback)
            return;

        for (const auto &event : events)
        {
            try
            {
                m_callback(event);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Monitor] Event handler failed: " << e.what() << "\n";
            }
        }
    }

    void MonitorLoop::Run()
    {
        while (!m_token->IsCancelled())
        {
            std::vector<MonitorEvent> events;
            try
            {
                events = RunCycle();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Monitor] Cycle failed: " << e.what() << "\n";
                MonitorEvent event{MonitorEventType::Error, {}, e.what()};
                events.push_back(event);
            }
            Dispatch(events);

            m_state = MonitorState::Sleeping;
            if (m_token->WaitFor(m_interval))
                break;
        }
        m_state = MonitorState::Stopped;
    }
}
