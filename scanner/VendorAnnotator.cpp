#include "VendorAnnotator.hpp"
#include "../common/Ipv4.hpp"

namespace net_map::scanner
{
    VendorAnnotator::VendorAnnotator(const VendorLookup &lookup) : m_lookup(lookup)
    {
    }

    std::string VendorAnnotator::Resolve(const std::string &mac) const
    {
        auto vendor = m_lookup.Lookup(mac);
        if (vendor && !vendor->empty())
            return *vendor;

        if (common::IsLocallyAdministered(mac))
            return RANDOM_MAC_VENDOR;
        return UNKNOWN_VENDOR;
    }

    void VendorAnnotator::Annotate(std::vector<DiscoveredHost> &hosts) const
    {
        for (auto &host : hosts)
        {
            host.vendor = Resolve(host.mac);
        }
    }
}
