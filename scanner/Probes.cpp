#include "Probes.hpp"
#include "../common/SocketHandle.hpp"
#include <tins/tins.h>
#include <arpa/inet.h>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace net_map::scanner
{
    namespace
    {
        // Each echo request gets its own identifier so concurrent probes
        // only match their own reply.
        std::uint16_t NextEchoId()
        {
            static std::atomic<std::uint16_t> counter{static_cast<std::uint16_t>(getpid())};
            return counter.fetch_add(1);
        }

        bool MakeAddress(const std::string &ip, std::uint16_t port, sockaddr_in &out)
        {
            std::memset(&out, 0, sizeof(out));
            out.sin_family = AF_INET;
            out.sin_port = htons(port);
            return inet_pton(AF_INET, ip.c_str(), &out.sin_addr) == 1;
        }

        int RemainingMs(std::chrono::steady_clock::time_point deadline)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            return left.count() > 0 ? static_cast<int>(left.count()) : 0;
        }
    }

    std::optional<int> PingTtl(const std::string &ip, std::chrono::milliseconds timeout)
    {
        try
        {
            Tins::IPv4Address target(ip);
            Tins::NetworkInterface iface(target);

            Tins::IP request = Tins::IP(target, iface.ipv4_address()) / Tins::ICMP();
            Tins::ICMP &icmp = request.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(NextEchoId());
            icmp.sequence(1);

            const auto ms = timeout.count();
            Tins::PacketSender sender(iface, static_cast<uint32_t>(ms / 1000),
                                      static_cast<uint32_t>((ms % 1000) * 1000));

            std::unique_ptr<Tins::PDU> reply(sender.send_recv(request, iface));
            if (!reply)
                return std::nullopt;

            const Tins::IP *header = reply->find_pdu<Tins::IP>();
            const Tins::ICMP *echo = reply->find_pdu<Tins::ICMP>();
            if (!header || !echo || echo->type() != Tins::ICMP::ECHO_REPLY)
                return std::nullopt;

            return static_cast<int>(header->ttl());
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Probe] ICMP probe of " << ip << " failed: " << e.what() << "\n";
            return std::nullopt;
        }
    }

    bool TcpConnect(const std::string &ip, std::uint16_t port, std::chrono::milliseconds timeout)
    {
        sockaddr_in addr;
        if (!MakeAddress(ip, port, addr))
            return false;

        common::SocketHandle sock(socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
        if (!sock.Valid())
            return false;

        if (connect(sock.Get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0)
            return true;
        if (errno != EINPROGRESS)
            return false;

        pollfd pfd{};
        pfd.fd = sock.Get();
        pfd.events = POLLOUT;
        if (poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0)
            return false;

        int err = 0;
        socklen_t len = sizeof(err);
        if (getsockopt(sock.Get(), SOL_SOCKET, SO_ERROR, &err, &len) != 0)
            return false;
        return err == 0;
    }

    std::vector<std::uint16_t> ConnectScan(const std::string &ip,
                                           const std::vector<std::uint16_t> &ports,
                                           std::chrono::milliseconds timeout)
    {
        std::vector<std::uint16_t> open;
        for (std::uint16_t port : ports)
        {
            if (TcpConnect(ip, port, timeout))
                open.push_back(port);
        }
        return open;
    }

    std::string BuildSsdpRequest()
    {
        return std::string("M-SEARCH * HTTP/1.1\r\n") +
               "HOST:" + defaults::SSDP_GROUP + ":" + std::to_string(defaults::SSDP_PORT) + "\r\n" +
               "MAN:\"ssdp:discover\"\r\n"
               "MX:1\r\n"
               "ST:ssdp:all\r\n"
               "\r\n";
    }

    std::vector<std::string> SsdpQuery(const std::string &ip,
                                       std::uint16_t port,
                                       std::chrono::milliseconds window)
    {
        std::vector<std::string> responses;

        sockaddr_in addr;
        if (!MakeAddress(ip, port, addr))
            return responses;

        common::SocketHandle sock(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
        if (!sock.Valid())
            return responses;

        const std::string request = BuildSsdpRequest();
        if (sendto(sock.Get(), request.data(), request.size(), 0,
                   reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) < 0)
            return responses;

        const auto deadline = std::chrono::steady_clock::now() + window;
        char buffer[2048];

        while (true)
        {
            int left = RemainingMs(deadline);
            if (left <= 0)
                break;

            pollfd pfd{};
            pfd.fd = sock.Get();
            pfd.events = POLLIN;
            if (poll(&pfd, 1, left) <= 0)
                break;

            ssize_t n = recv(sock.Get(), buffer, sizeof(buffer), 0);
            if (n < 0)
                break;
            responses.emplace_back(buffer, static_cast<std::size_t>(n));
        }
        return responses;
    }

    NetworkProber::NetworkProber(std::vector<std::uint16_t> ports, ProbeSettings settings)
        : m_ports(std::move(ports)), m_settings(settings)
    {
    }

    ProbeResult NetworkProber::Probe(const DiscoveredHost &host)
    {
        ProbeResult result;
        result.ttl = PingTtl(host.ip, m_settings.icmp_timeout);
        result.open_ports = ConnectScan(host.ip, m_ports, m_settings.connect_timeout);
        result.ssdp = SsdpQuery(host.ip, m_settings.ssdp_port, m_settings.ssdp_window);
        return result;
    }
}
