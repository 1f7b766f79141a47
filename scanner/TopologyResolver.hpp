#pragma once

#include <optional>
#include <string>
#include <vector>
#include "TopologyProvider.hpp"
#include "Types.hpp"

namespace net_map::scanner
{
    class TopologyResolver
    {
    public:
        explicit TopologyResolver(TopologyProvider &provider);

        // Throws common::TopologyError when no usable interface/address/mask
        // can be determined.
        InterfaceContext Resolve(const std::optional<std::string> &iface) const;

        // Lowest-metric 0.0.0.0/0 route, restricted to `iface` when given.
        static std::optional<RouteInfo> BestDefaultRoute(const std::vector<RouteInfo> &routes,
                                                         const std::optional<std::string> &iface = std::nullopt);

    private:
        TopologyProvider &m_provider;
    };
}
