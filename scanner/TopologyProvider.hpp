#pragma once

#include <optional>
#include <string>
#include <vector>

namespace net_map::scanner
{
    struct RouteInfo
    {
        std::string interface;
        std::string destination;
        std::string gateway;
        std::string mask;
        int metric = 0;
    };

    struct InterfaceInfo
    {
        std::string name;
        std::string address;
        std::string netmask;
        std::string hw_address;
        bool is_up = false;
    };

    // OS routing/interface state. Implementations report failures as empty
    // results and never throw.
    class TopologyProvider
    {
    public:
        virtual ~TopologyProvider() = default;

        virtual std::vector<RouteInfo> ListRoutes() = 0;
        virtual std::optional<InterfaceInfo> QueryInterface(const std::string &name) = 0;
    };

    class TinsTopologyProvider : public TopologyProvider
    {
    public:
        std::vector<RouteInfo> ListRoutes() override;
        std::optional<InterfaceInfo> QueryInterface(const std::string &name) override;
    };
}
