#include "HeuristicTables.hpp"
#include "../common/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace net_map::scanner
{
    namespace
    {
        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        void ReadVendors(const nlohmann::json &doc, const char *key, std::vector<std::string> &out)
        {
            if (!doc.contains(key))
                return;

            std::vector<std::string> values;
            for (const auto &item : doc.at(key).get<std::vector<std::string>>())
            {
                if (!item.empty())
                    values.push_back(Lower(item));
            }
            out = values;
        }

        void ReadPorts(const nlohmann::json &doc, const char *key, std::set<std::uint16_t> &out)
        {
            if (!doc.contains(key))
                return;

            std::set<std::uint16_t> values;
            for (long long port : doc.at(key).get<std::vector<long long>>())
            {
                if (port < 1 || port > 65535)
                    throw common::ConfigurationError(std::string("Port out of range in '") + key + "': " + std::to_string(port));
                values.insert(static_cast<std::uint16_t>(port));
            }
            out = values;
        }
    }

    HeuristicTables HeuristicTables::Defaults()
    {
        HeuristicTables t;
        t.infrastructure_vendors = {"cisco", "ubiquiti", "tplink", "tp-link", "netgear",
                                    "mikrotik", "aruba", "juniper", "d-link", "huawei", "zyxel"};
        t.iot_vendors = {"espressif", "tuya", "sonoff", "shelly", "tapo", "hikvision", "ring", "dahua"};
        t.chipset_vendors = {"realtek", "broadcom", "qualcomm", "mediatek", "intel"};
        t.mobile_brands = {"apple", "samsung", "xiaomi", "huawei", "oppo",
                           "oneplus", "motorola", "sony", "google"};

        t.base_ports = {22, 80, 443, 445};
        t.printer_ports = {515, 631, 9100};
        t.nas_ports = {5000, 5001, 32400};
        t.tv_ports = {5500, 7000, 8008, 8009, 8443, 8200, 32469};
        t.web_ports = {80, 443};
        t.management_ports = {22, 445};
        return t;
    }

    HeuristicTables HeuristicTables::FromJson(const nlohmann::json &doc)
    {
        if (!doc.is_object())
            throw common::ConfigurationError("Heuristics document must be a JSON object");

        HeuristicTables t = Defaults();
        try
        {
            ReadVendors(doc, "infrastructure_vendors", t.infrastructure_vendors);
            ReadVendors(doc, "iot_vendors", t.iot_vendors);
            ReadVendors(doc, "chipset_vendors", t.chipset_vendors);
            ReadVendors(doc, "mobile_brands", t.mobile_brands);

            ReadPorts(doc, "base_ports", t.base_ports);
            ReadPorts(doc, "printer_ports", t.printer_ports);
            ReadPorts(doc, "nas_ports", t.nas_ports);
            ReadPorts(doc, "tv_ports", t.tv_ports);
            ReadPorts(doc, "web_ports", t.web_ports);
            ReadPorts(doc, "management_ports", t.management_ports);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw common::ConfigurationError(std::string("Invalid heuristics document: ") + e.what());
        }
        return t;
    }

    HeuristicTables HeuristicTables::LoadFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
            throw common::ConfigurationError("Cannot open heuristics file: " + path);

        nlohmann::json doc;
        try
        {
            file >> doc;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw common::ConfigurationError("Cannot parse heuristics file " + path + ": " + e.what());
        }
        return FromJson(doc);
    }

    std::vector<std::uint16_t> HeuristicTables::CandidatePorts() const
    {
        std::set<std::uint16_t> all = base_ports;
        all.insert(printer_ports.begin(), printer_ports.end());
        all.insert(nas_ports.begin(), nas_ports.end());
        all.insert(tv_ports.begin(), tv_ports.end());
        return std::vector<std::uint16_t>(all.begin(), all.end());
    }
}
