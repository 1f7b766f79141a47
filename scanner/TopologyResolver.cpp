#include "TopologyResolver.hpp"
#include "../common/Errors.hpp"
#include <iostream>

namespace net_map::scanner
{
    namespace
    {
        bool IsDefaultRoute(const RouteInfo &route)
        {
            return route.destination == "0.0.0.0" && route.mask == "0.0.0.0";
        }
    }

    TopologyResolver::TopologyResolver(TopologyProvider &provider) : m_provider(provider)
    {
    }

    std::optional<RouteInfo> TopologyResolver::BestDefaultRoute(const std::vector<RouteInfo> &routes,
                                                                const std::optional<std::string> &iface)
    {
        std::optional<RouteInfo> best;
        for (const auto &route : routes)
        {
            if (!IsDefaultRoute(route))
                continue;
            if (iface && route.interface != *iface)
                continue;
            if (!best || route.metric < best->metric)
                best = route;
        }
        return best;
    }

    InterfaceContext TopologyResolver::Resolve(const std::optional<std::string> &iface) const
    {
        if (iface && iface->empty())
            throw common::ConfigurationError("Interface name must not be empty");

        std::vector<RouteInfo> routes = m_provider.ListRoutes();

        std::string name;
        std::optional<RouteInfo> gatewayRoute;

        if (iface)
        {
            name = *iface;
            gatewayRoute = BestDefaultRoute(routes, iface);
            if (!gatewayRoute)
                gatewayRoute = BestDefaultRoute(routes);
        }
        else
        {
            gatewayRoute = BestDefaultRoute(routes);
            if (!gatewayRoute)
                throw common::TopologyError("Could not detect the default interface; pass one explicitly with --iface");
            name = gatewayRoute->interface;
        }

        auto info = m_provider.QueryInterface(name);
        if (!info)
            throw common::TopologyError("Interface '" + name + "' not found");

        if (!info->is_up)
            throw common::TopologyError("Interface '" + name + "' is down");

        if (info->address.empty() || info->address == "0.0.0.0")
            throw common::TopologyError("Interface '" + name + "' has no IPv4 address assigned");

        auto subnet = common::SubnetFromAddress(info->address, info->netmask);
        if (!subnet)
            throw common::TopologyError("Could not read the netmask of interface '" + name + "'");

        InterfaceContext ctx;
        ctx.name = name;
        ctx.address = info->address;
        ctx.subnet = *subnet;
        if (gatewayRoute && gatewayRoute->gateway != "0.0.0.0" && !gatewayRoute->gateway.empty())
            ctx.gateway = gatewayRoute->gateway;

        std::cout << "[Topology] Interface: " << ctx.name
                  << " (IP: " << ctx.address
                  << ", Subnet: " << ctx.subnet.ToString()
                  << ", Gateway: " << ctx.gateway.value_or("none") << ")\n";
        return ctx;
    }
}
