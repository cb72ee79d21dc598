#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace lan_recon::common
{
    // Owns a set of worker threads and joins them on destruction, so an
    // exception thrown while the workers run unwinds without terminating.
    // Workers must be able to finish on their own, e.g. by draining a closed Channel.
    class WorkerPool
    {
    public:
        WorkerPool() = default;
        ~WorkerPool();

        // Starts up to `count` threads running `work` and returns how many
        // started. Throws std::system_error only when none could be started.
        size_t Start(size_t count, const std::function<void()> &work);
        void Join();

    private:
        std::vector<std::thread> m_threads;

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;
    };
}
