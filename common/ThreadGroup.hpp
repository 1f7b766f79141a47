#pragma once

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace net_map::common
{
    // Joins every thread it started, including when the owner unwinds.
    class ThreadGroup
    {
    public:
        ThreadGroup() = default;
        ~ThreadGroup() { JoinAll(); }

        ThreadGroup(const ThreadGroup &) = delete;
        ThreadGroup &operator=(const ThreadGroup &) = delete;

        void Reserve(std::size_t count) { m_threads.reserve(count); }

        template <typename Fn, typename... Args>
        void Spawn(Fn &&fn, Args &&...args)
        {
            m_threads.emplace_back(std::forward<Fn>(fn), std::forward<Args>(args)...);
        }

        void JoinAll()
        {
            for (auto &t : m_threads)
            {
                if (t.joinable())
                    t.join();
            }
            m_threads.clear();
        }

        std::size_t Size() const { return m_threads.size(); }

    private:
        std::vector<std::thread> m_threads;
    };
}
