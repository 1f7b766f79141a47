#pragma once

#include <unistd.h>

namespace net_map::common
{
    class SocketHandle
    {
    public:
        explicit SocketHandle(int fd = -1) : m_fd(fd) {}
        ~SocketHandle() { Reset(); }

        SocketHandle(const SocketHandle &) = delete;
        SocketHandle &operator=(const SocketHandle &) = delete;

        SocketHandle(SocketHandle &&other) noexcept : m_fd(other.m_fd) { other.m_fd = -1; }
        SocketHandle &operator=(SocketHandle &&other) noexcept
        {
            if (this != &other)
            {
                Reset();
                m_fd = other.m_fd;
                other.m_fd = -1;
            }
            return *this;
        }

        int Get() const { return m_fd; }
        bool Valid() const { return m_fd >= 0; }

        void Reset()
        {
            if (m_fd >= 0)
            {
                close(m_fd);
                m_fd = -1;
            }
        }

    private:
        int m_fd;
    };
}
