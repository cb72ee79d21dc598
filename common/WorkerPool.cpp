#include "WorkerPool.hpp"
#include <iostream>
#include <system_error>

namespace lan_recon::common
{
    WorkerPool::~WorkerPool()
    {
        Join();
    }

    size_t WorkerPool::Start(size_t count, const std::function<void()> &work)
    {
        m_threads.reserve(m_threads.size() + count);
        size_t started = 0;
        for (; started < count; ++started)
        {
            try
            {
                m_threads.emplace_back(work);
            }
            catch (const std::system_error &e)
            {
                if (m_threads.empty())
                    throw;
                std::cerr << "[WorkerPool] Started " << started << " of " << count << " workers: " << e.what() << "\n";
                break;
            }
        }
        return started;
    }

    void WorkerPool::Join()
    {
        for (auto &t : m_threads)
        {
            if (t.joinable())
                t.join();
        }
        m_threads.clear();
    }
}
