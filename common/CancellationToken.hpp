#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace lan_recon::common
{
    class CancellationToken
    {
    public:
        void Cancel();
        bool IsCancelled() const { return m_cancelled; }

        // Sleeps up to `duration`; returns true as soon as the token is cancelled.
        bool WaitFor(std::chrono::milliseconds duration) const;

    private:
        std::atomic<bool> m_cancelled{false};
        mutable std::mutex m_mutex;
        mutable std::condition_variable m_cv;
    };
}
