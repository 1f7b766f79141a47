#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../common/Defaults.hpp"
#include "Types.hpp"

namespace net_map::scanner
{
    // None of the probes throw. A missing signal is an empty value.

    // One ICMP echo; TTL of the reply's IP header.
    std::optional<int> PingTtl(const std::string &ip, std::chrono::milliseconds timeout);

    // Open only when the TCP handshake completes within `timeout`.
    bool TcpConnect(const std::string &ip, std::uint16_t port, std::chrono::milliseconds timeout);
    std::vector<std::uint16_t> ConnectScan(const std::string &ip,
                                           const std::vector<std::uint16_t> &ports,
                                           std::chrono::milliseconds timeout);

    std::string BuildSsdpRequest();
    // Unicast M-SEARCH; every datagram received inside `window` is kept.
    std::vector<std::string> SsdpQuery(const std::string &ip,
                                       std::uint16_t port,
                                       std::chrono::milliseconds window);

    struct ProbeSettings
    {
        std::chrono::milliseconds icmp_timeout = defaults::ICMP_TIMEOUT;
        std::chrono::milliseconds connect_timeout = defaults::CONNECT_TIMEOUT;
        std::chrono::milliseconds ssdp_window = defaults::SSDP_WINDOW;
        std::uint16_t ssdp_port = defaults::SSDP_PORT;
    };

    // Called concurrently from the probe pool; implementations must be
    // thread-safe.
    class HostProber
    {
    public:
        virtual ~HostProber() = default;
        virtual ProbeResult Probe(const DiscoveredHost &host) = 0;
    };

    class NetworkProber : public HostProber
    {
    public:
        explicit NetworkProber(std::vector<std::uint16_t> ports, ProbeSettings settings = ProbeSettings());

        ProbeResult Probe(const DiscoveredHost &host) override;

    private:
        std::vector<std::uint16_t> m_ports;
        ProbeSettings m_settings;
    };
}
