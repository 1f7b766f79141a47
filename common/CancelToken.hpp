#pragma once

#include <atomic>

namespace net_map::common
{
    class CancelToken
    {
    public:
        void Cancel() { m_cancelled = true; }
        bool IsCancelled() const { return m_cancelled; }

    private:
        std::atomic<bool> m_cancelled{false};
    };
}
