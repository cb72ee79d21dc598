#include "CancellationToken.hpp"

namespace lan_recon::common
{
    void CancellationToken::Cancel()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled = true;
        }
        m_cv.notify_all();
    }

    bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, duration, [this]
                             { return m_cancelled.load(); });
    }
}
