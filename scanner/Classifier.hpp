#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "HeuristicTables.hpp"
#include "Types.hpp"

namespace net_map::scanner
{
    // Deterministic device categorisation. Rules are evaluated in a fixed
    // priority order and the first match wins:
    //   gateway, printer ports, TV ports, infrastructure vendor, IoT vendor,
    //   randomised MAC / mobile brand, TTL fallback, unknown.
    class Classifier
    {
    public:
        explicit Classifier(HeuristicTables tables = HeuristicTables::Defaults());

        std::string Classify(const std::string &vendor,
                             const std::string &ip,
                             const std::optional<std::string> &gateway,
                             const std::string &mac,
                             std::optional<int> ttl,
                             const std::vector<std::uint16_t> &open_ports,
                             const std::vector<std::string> &ssdp) const;

        std::string Classify(const ProbedHost &probed, const std::optional<std::string> &gateway) const;

        const HeuristicTables &Tables() const { return m_tables; }

    private:
        HeuristicTables m_tables;
    };
}
