#include "SummaryTable.hpp"
#include <sstream>
#include <vector>

namespace net_map::cli
{
    namespace
    {
        // Pipes inside a cell would split the row.
        std::string Cell(const std::string &value)
        {
            std::string out;
            for (char c : value)
            {
                if (c == '|')
                    out += "\\|";
                else
                    out += c;
            }
            return out;
        }

        std::string JoinPorts(const std::vector<std::uint16_t> &ports)
        {
            std::string out;
            for (std::size_t i = 0; i < ports.size(); ++i)
            {
                if (i > 0)
                    out += ", ";
                out += std::to_string(ports[i]);
            }
            return out;
        }
    }

    std::string RenderSummaryTable(const scanner::ScanSnapshot &snapshot)
    {
        std::stringstream ss;
        const bool deep = snapshot.meta.deep;

        if (deep)
        {
            ss << "| # | IP | MAC | Vendor | TTL | Open ports | Clase |\n";
            ss << "|---|----|-----|--------|-----|------------|-------|\n";
        }
        else
        {
            ss << "| # | IP | MAC | Vendor |\n";
            ss << "|---|----|-----|--------|\n";
        }

        int row = 1;
        for (const auto &d : snapshot.devices)
        {
            ss << "| " << row++ << " | " << Cell(d.ip) << " | " << Cell(d.mac) << " | " << Cell(d.vendor) << " |";
            if (deep)
            {
                std::string ttl = (d.probe && d.probe->ttl) ? std::to_string(*d.probe->ttl) : "-";
                std::string ports = d.probe ? JoinPorts(d.probe->open_ports) : "";
                ss << " " << ttl << " | " << (ports.empty() ? "-" : ports) << " | " << Cell(d.category) << " |";
            }
            ss << "\n";
        }
        return ss.str();
    }
}
