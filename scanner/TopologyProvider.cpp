#include "TopologyProvider.hpp"
#include <tins/tins.h>
#include <iostream>

namespace net_map::scanner
{
    std::vector<RouteInfo> TinsTopologyProvider::ListRoutes()
    {
        std::vector<RouteInfo> routes;
        try
        {
            for (const auto &entry : Tins::Utils::route_entries())
            {
                RouteInfo route;
                route.interface = entry.interface;
                route.destination = entry.destination.to_string();
                route.gateway = entry.gateway.to_string();
                route.mask = entry.mask.to_string();
                route.metric = entry.metric;
                routes.push_back(route);
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Topology] Could not read routing table: " << e.what() << "\n";
            routes.clear();
        }
        return routes;
    }

    std::optional<InterfaceInfo> TinsTopologyProvider::QueryInterface(const std::string &name)
    {
        try
        {
            Tins::NetworkInterface iface(name);
            Tins::NetworkInterface::Info info = iface.info();

            InterfaceInfo out;
            out.name = iface.name();
            out.address = info.ip_addr.to_string();
            out.netmask = info.netmask.to_string();
            out.hw_address = info.hw_addr.to_string();
            out.is_up = info.is_up;
            return out;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Topology] Interface '" << name << "' unavailable: " << e.what() << "\n";
            return std::nullopt;
        }
    }
}
