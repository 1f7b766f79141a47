#include "ArpDiscovery.hpp"
#include "../common/Defaults.hpp"
#include "../common/Errors.hpp"
#include <tins/tins.h>
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace net_map::scanner
{
    namespace
    {
        bool IsRoot()
        {
            return geteuid() == 0;
        }

        std::string PrivilegeHint()
        {
            return IsRoot() ? "" : " (raw link-layer access usually requires root)";
        }

        Tins::SnifferConfiguration ReplyFilter()
        {
            Tins::SnifferConfiguration config;
            config.set_promisc_mode(false);
            config.set_immediate_mode(true);
            config.set_filter("arp and arp[6:2] == 2");
            config.set_timeout(100);
            return config;
        }

        // Owns the capture thread; stops and joins it on every exit path.
        class ReplySniffer
        {
        public:
            ReplySniffer(const std::string &iface, ReplyCollector &collector)
                : m_sniffer(iface, ReplyFilter()), m_collector(collector), m_stop(false)
            {
                m_thread = std::thread(&ReplySniffer::CaptureLoop, this);
            }

            ~ReplySniffer()
            {
                Stop();
            }

            void Stop()
            {
                if (m_stop.exchange(true))
                    return;
                m_sniffer.stop_sniff();
                if (m_thread.joinable())
                    m_thread.join();
            }

        private:
            void CaptureLoop()
            {
                while (!m_stop)
                {
                    try
                    {
                        Tins::PtrPacket packet = m_sniffer.next_packet();
                        if (!packet)
                            continue;

                        const Tins::ARP *arp = packet.pdu()->find_pdu<Tins::ARP>();
                        if (arp && arp->opcode() == Tins::ARP::REPLY)
                        {
                            m_collector.Accept(arp->sender_ip_addr().to_string(),
                                               arp->sender_hw_addr().to_string());
                        }
                    }
                    catch (const std::exception &e)
                    {
                        std::cerr << "[Discovery] Capture stopped: " << e.what() << "\n";
                        break;
                    }
                }
            }

            Tins::Sniffer m_sniffer;
            ReplyCollector &m_collector;
            std::atomic<bool> m_stop;
            std::thread m_thread;
        };

        void SendSweep(Tins::PacketSender &sender,
                       const Tins::NetworkInterface &iface,
                       const Tins::NetworkInterface::Info &info,
                       const SweepRange &range,
                       std::uint32_t own)
        {
            for (std::uint64_t t = range.first; t <= range.last; ++t)
            {
                const auto target = static_cast<std::uint32_t>(t);
                if (target == own)
                    continue;

                Tins::EthernetII request = Tins::ARP::make_arp_request(
                    Tins::IPv4Address(common::FormatIpv4(target)), info.ip_addr, info.hw_addr);
                sender.send(request, iface);

                std::this_thread::sleep_for(std::chrono::microseconds(300));
            }
        }
    }

    ReplyCollector::ReplyCollector(common::Subnet subnet, std::string own_ip)
        : m_subnet(subnet), m_own_ip(std::move(own_ip))
    {
    }

    bool ReplyCollector::Accept(const std::string &ip, const std::string &mac)
    {
        if (ip == m_own_ip || !m_subnet.Contains(ip))
            return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        m_replies[ip] = mac;
        return true;
    }

    std::vector<DiscoveredHost> ReplyCollector::Hosts() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<DiscoveredHost> hosts;
        hosts.reserve(m_replies.size());
        for (const auto &reply : m_replies)
        {
            hosts.push_back({reply.first, reply.second, ""});
        }
        return hosts;
    }

    std::size_t ReplyCollector::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_replies.size();
    }

    SweepRange SweepTargets(const common::Subnet &subnet, const std::string &own_ip)
    {
        if (subnet.prefix >= defaults::WIDEST_SWEEP_PREFIX)
            return {subnet.FirstHost(), subnet.LastHost()};

        const std::uint32_t own = common::ParseIpv4(own_ip).value_or(subnet.network);
        const common::Subnet block{own & common::MaskFromPrefix(defaults::WIDEST_SWEEP_PREFIX),
                                   defaults::WIDEST_SWEEP_PREFIX};

        // Network and broadcast of the outer subnet are never targets.
        return {std::max(block.network, subnet.FirstHost()),
                std::min(block.Broadcast(), subnet.LastHost())};
    }

    int RunSweeps(const ReplyCollector &collector,
                  const std::function<void()> &sweep,
                  const std::function<void(std::chrono::milliseconds)> &wait,
                  std::chrono::milliseconds timeout,
                  int retries)
    {
        int sweeps = 0;
        for (int attempt = 0; attempt <= retries; ++attempt)
        {
            if (attempt > 0)
                std::cout << "[Discovery] No replies yet, retrying sweep (" << attempt << "/" << retries << ")\n";

            sweep();
            ++sweeps;
            wait(timeout);

            if (collector.Size() > 0)
                break;
        }
        return sweeps;
    }

    std::vector<DiscoveredHost> ArpDiscovery::Discover(const InterfaceContext &ctx,
                                                       std::chrono::milliseconds timeout,
                                                       int retries)
    {
        const SweepRange range = SweepTargets(ctx.subnet, ctx.address);
        if (ctx.subnet.prefix < defaults::WIDEST_SWEEP_PREFIX)
        {
            std::cerr << "[Discovery] Warning: " << ctx.subnet.ToString() << " is wider than /"
                      << defaults::WIDEST_SWEEP_PREFIX << ", sweeping " << common::FormatIpv4(range.first)
                      << " - " << common::FormatIpv4(range.last) << " only\n";
        }

        const std::uint32_t own = common::ParseIpv4(ctx.address).value_or(0);
        ReplyCollector collector(ctx.subnet, ctx.address);

        try
        {
            Tins::NetworkInterface iface(ctx.name);
            Tins::NetworkInterface::Info info = iface.info();

            ReplySniffer sniffer(ctx.name, collector);
            Tins::PacketSender sender(iface);

            RunSweeps(
                collector,
                [&]()
                { SendSweep(sender, iface, info, range, own); },
                [](std::chrono::milliseconds wait)
                { std::this_thread::sleep_for(wait); },
                timeout, retries);

            sniffer.Stop();
        }
        catch (const std::exception &e)
        {
            throw common::DiscoveryError("ARP sweep on " + ctx.name + " failed: " + e.what() + PrivilegeHint());
        }

        std::vector<DiscoveredHost> hosts = collector.Hosts();
        std::cout << "[Discovery] " << hosts.size() << " host(s) answered on " << ctx.subnet.ToString() << "\n";
        return hosts;
    }
}
