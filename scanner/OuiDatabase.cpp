#include "OuiDatabase.hpp"
#include "../common/Ipv4.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace net_map::scanner
{
    namespace
    {
        std::string Trim(const std::string &s)
        {
            const char *ws = " \t\r\n";
            auto start = s.find_first_not_of(ws);
            if (start == std::string::npos)
                return "";
            auto end = s.find_last_not_of(ws);
            return s.substr(start, end - start + 1);
        }

        std::vector<std::string> SplitTabs(const std::string &line)
        {
            std::vector<std::string> fields;
            std::stringstream ss(line);
            std::string field;
            while (std::getline(ss, field, '\t'))
            {
                field = Trim(field);
                if (!field.empty())
                    fields.push_back(field);
            }
            return fields;
        }
    }

    bool OuiDatabase::LoadFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            std::cerr << "[Vendor] Cannot open OUI database: " << path << "\n";
            return false;
        }

        std::size_t loaded = Load(file);
        std::cout << "[Vendor] Loaded " << loaded << " OUI entries from " << path << "\n";
        return true;
    }

    std::size_t OuiDatabase::Load(std::istream &in)
    {
        std::size_t loaded = 0;
        std::string line;
        while (std::getline(in, line))
        {
            std::string trimmed = Trim(line);
            if (trimmed.empty() || trimmed[0] == '#')
                continue;

            bool ok = trimmed.find("(hex)") != std::string::npos ? ParseIeeeLine(trimmed)
                                                                 : ParseManufLine(trimmed);
            if (ok)
                ++loaded;
        }
        return loaded;
    }

    bool OuiDatabase::ParseManufLine(const std::string &line)
    {
        std::vector<std::string> fields = SplitTabs(line);
        if (fields.size() < 2)
            return false;

        std::string prefix = fields[0];
        auto slash = prefix.find('/');
        if (slash != std::string::npos)
        {
            if (prefix.substr(slash + 1) != "24")
                return false;
            prefix = prefix.substr(0, slash);
        }

        auto key = common::OuiKey(prefix);
        if (!key || prefix.size() > 8)
            return false;

        std::string shortName = fields[1];
        std::string longName = fields.size() > 2 ? fields[2] : "";

        // Older files put the long name in a trailing comment.
        auto hash = shortName.find('#');
        if (hash != std::string::npos)
        {
            longName = Trim(shortName.substr(hash + 1));
            shortName = Trim(shortName.substr(0, hash));
        }

        std::string name = longName.empty() ? shortName : longName;
        if (name.empty())
            return false;

        m_vendors[*key] = name;
        return true;
    }

    bool OuiDatabase::ParseIeeeLine(const std::string &line)
    {
        auto marker = line.find("(hex)");
        std::string prefix = Trim(line.substr(0, marker));
        std::string name = Trim(line.substr(marker + 5));

        auto key = common::OuiKey(prefix);
        if (!key || prefix.size() != 8 || name.empty())
            return false;

        m_vendors[*key] = name;
        return true;
    }

    std::optional<std::string> OuiDatabase::Lookup(const std::string &mac) const
    {
        auto key = common::OuiKey(mac);
        if (!key)
            return std::nullopt;

        auto it = m_vendors.find(*key);
        if (it == m_vendors.end())
            return std::nullopt;
        return it->second;
    }
}
