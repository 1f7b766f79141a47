#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace net_map::common
{
    template <typename T>
    class ThreadSafeQueue
    {
    private:
        std::queue<T> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_shutdown = false;

    public:
        void Push(T value)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queue.push(std::move(value));
            }
            m_cv.notify_one();
        }

        // Blocks until an item is available. After Shutdown() the remaining
        // items are still handed out, then std::nullopt.
        std::optional<T> Pop()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]
                      { return !m_queue.empty() || m_shutdown; });

            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop();
            return value;
        }

        void Shutdown()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_shutdown = true;
            }
            m_cv.notify_all();
        }

        // Drops every pending item and returns how many were discarded.
        std::size_t Drain()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            std::size_t dropped = m_queue.size();
            std::queue<T> empty;
            std::swap(m_queue, empty);
            return dropped;
        }

        std::size_t Size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }
    };
}
