#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>

namespace net_map::scanner
{
    class VendorLookup
    {
    public:
        virtual ~VendorLookup() = default;
        virtual std::optional<std::string> Lookup(const std::string &mac) const = 0;
    };

    // MAC prefix -> manufacturer table. Reads Wireshark "manuf" files
    // ("00:00:0C<TAB>Cisco<TAB>Cisco Systems, Inc") and IEEE oui.txt
    // ("00-00-0C   (hex)<TAB><TAB>Cisco Systems, Inc").
    class OuiDatabase : public VendorLookup
    {
    public:
        bool LoadFile(const std::string &path);
        std::size_t Load(std::istream &in);

        std::optional<std::string> Lookup(const std::string &mac) const override;
        std::size_t Size() const { return m_vendors.size(); }

    private:
        bool ParseManufLine(const std::string &line);
        bool ParseIeeeLine(const std::string &line);

        std::unordered_map<std::string, std::string> m_vendors;
    };
}
