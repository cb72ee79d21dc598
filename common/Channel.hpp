#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace lan_recon::common
{
    // Multi-producer channel. After Close(), Receive drains what is left and
    // then returns nullopt.
    template <typename T>
    class Channel
    {
    private:
        std::queue<T> m_queue;
        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_closed = false;

    public:
        bool Send(T value)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_closed)
                    return false;
                m_queue.push(std::move(value));
            }
            m_cv.notify_one();
            return true;
        }

        std::optional<T> Receive()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]
                      { return !m_queue.empty() || m_closed; });
            return PopLocked();
        }

        void Close()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_closed = true;
            }
            m_cv.notify_all();
        }

    private:
        std::optional<T> PopLocked()
        {
            if (m_queue.empty())
                return std::nullopt;
            T value = std::move(m_queue.front());
            m_queue.pop();
            return value;
        }
    };
}
