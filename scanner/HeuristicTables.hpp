#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace net_map::scanner
{
    // Lookup data behind the classifier. Vendor entries are lower-case
    // substrings matched against the vendor label.
    struct HeuristicTables
    {
        std::vector<std::string> infrastructure_vendors;
        std::vector<std::string> iot_vendors;
        std::vector<std::string> chipset_vendors;
        std::vector<std::string> mobile_brands;

        std::set<std::uint16_t> base_ports;
        std::set<std::uint16_t> printer_ports;
        std::set<std::uint16_t> nas_ports;
        std::set<std::uint16_t> tv_ports;
        std::set<std::uint16_t> web_ports;
        std::set<std::uint16_t> management_ports;

        static HeuristicTables Defaults();

        // Keys absent from the document keep their default value. Throws
        // common::ConfigurationError on malformed input.
        static HeuristicTables FromJson(const nlohmann::json &doc);
        static HeuristicTables LoadFile(const std::string &path);

        // Sorted union of the base, printer, NAS and TV ports.
        std::vector<std::uint16_t> CandidatePorts() const;
    };
}
