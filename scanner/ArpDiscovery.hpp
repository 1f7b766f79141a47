#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "Types.hpp"

namespace net_map::scanner
{
    class HostDiscovery
    {
    public:
        virtual ~HostDiscovery() = default;

        // Empty result when nobody answers. Throws common::DiscoveryError when
        // the link layer cannot be used at all.
        virtual std::vector<DiscoveredHost> Discover(const InterfaceContext &ctx,
                                                     std::chrono::milliseconds timeout,
                                                     int retries) = 0;
    };

    // Collects ARP replies. Drops senders outside the subnet and our own
    // address; the last reply for an IP wins.
    class ReplyCollector
    {
    public:
        ReplyCollector(common::Subnet subnet, std::string own_ip);

        bool Accept(const std::string &ip, const std::string &mac);
        std::vector<DiscoveredHost> Hosts() const;
        std::size_t Size() const;

    private:
        common::Subnet m_subnet;
        std::string m_own_ip;
        std::map<std::string, std::string> m_replies;
        mutable std::mutex m_mutex;
    };

    // Inclusive range of target addresses for one sweep.
    struct SweepRange
    {
        std::uint32_t first = 0;
        std::uint32_t last = 0;
    };

    // Every host address of the subnet, or of the /WIDEST_SWEEP_PREFIX block
    // containing own_ip when the subnet is wider than that.
    SweepRange SweepTargets(const common::Subnet &subnet, const std::string &own_ip);

    // Calls sweep then wait(timeout) until the collector holds a reply or
    // retries extra rounds are used up. Returns the number of sweeps sent.
    int RunSweeps(const ReplyCollector &collector,
                  const std::function<void()> &sweep,
                  const std::function<void(std::chrono::milliseconds)> &wait,
                  std::chrono::milliseconds timeout,
                  int retries);

    class ArpDiscovery : public HostDiscovery
    {
    public:
        std::vector<DiscoveredHost> Discover(const InterfaceContext &ctx,
                                             std::chrono::milliseconds timeout,
                                             int retries) override;
    };
}
