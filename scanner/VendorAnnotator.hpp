#pragma once

#include <string>
#include <vector>
#include "OuiDatabase.hpp"
#include "Types.hpp"

namespace net_map::scanner
{
    inline constexpr const char *UNKNOWN_VENDOR = "Unknown";
    inline constexpr const char *RANDOM_MAC_VENDOR = "MAC Aleatoria (posible móvil)";

    class VendorAnnotator
    {
    public:
        explicit VendorAnnotator(const VendorLookup &lookup);

        std::string Resolve(const std::string &mac) const;
        void Annotate(std::vector<DiscoveredHost> &hosts) const;

    private:
        const VendorLookup &m_lookup;
    };
}
