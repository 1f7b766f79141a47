#include "Classifier.hpp"
#include "../common/Ipv4.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace net_map::scanner
{
    namespace
    {
        std::string Lower(const std::string &s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        bool MatchesAny(const std::string &vendorLower, const std::vector<std::string> &needles)
        {
            return std::any_of(needles.begin(), needles.end(), [&](const std::string &needle)
                               { return vendorLower.find(needle) != std::string::npos; });
        }

        bool Intersects(const std::set<std::uint16_t> &open, const std::set<std::uint16_t> &wanted)
        {
            return std::any_of(wanted.begin(), wanted.end(), [&](std::uint16_t port)
                               { return open.count(port) > 0; });
        }

        bool InRange(int value, int low, int high)
        {
            return value >= low && value <= high;
        }
    }

    Classifier::Classifier(HeuristicTables tables) : m_tables(std::move(tables))
    {
    }

    std::string Classifier::Classify(const std::string &vendor,
                                     const std::string &ip,
                                     const std::optional<std::string> &gateway,
                                     const std::string &mac,
                                     std::optional<int> ttl,
                                     const std::vector<std::uint16_t> &open_ports,
                                     const std::vector<std::string> &ssdp) const
    {
        const std::string v = Lower(vendor.empty() ? "Unknown" : vendor);
        const std::set<std::uint16_t> open(open_ports.begin(), open_ports.end());

        if (gateway && ip == *gateway)
            return category::ROUTER;

        if (Intersects(open, m_tables.printer_ports))
            return category::PRINTER;
        if (Intersects(open, m_tables.tv_ports))
            return category::TV;

        if (MatchesAny(v, m_tables.infrastructure_vendors))
        {
            if (Intersects(open, m_tables.web_ports) || !ssdp.empty())
                return category::SWITCH_AP;
            return category::INFRASTRUCTURE;
        }

        if (MatchesAny(v, m_tables.iot_vendors))
            return category::IOT;

        const bool mobileBrand = MatchesAny(v, m_tables.mobile_brands);
        if (common::IsLocallyAdministered(mac) || mobileBrand)
            return category::MOBILE;

        // TTL 0 carries no information and is treated like no reply.
        if (ttl && *ttl != 0)
        {
            if (InRange(*ttl, 120, 130) || Intersects(open, m_tables.management_ports) ||
                MatchesAny(v, m_tables.chipset_vendors))
                return category::COMPUTER;

            if (InRange(*ttl, 58, 66))
            {
                if (Intersects(open, m_tables.web_ports))
                    return category::SWITCH_AP;
                if (mobileBrand)
                    return category::MOBILE;
                return category::COMPUTER;
            }
        }

        return category::UNKNOWN;
    }

    std::string Classifier::Classify(const ProbedHost &probed, const std::optional<std::string> &gateway) const
    {
        return Classify(probed.host.vendor, probed.host.ip, gateway, probed.host.mac,
                        probed.result.ttl, probed.result.open_ports, probed.result.ssdp);
    }
}
