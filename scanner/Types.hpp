#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "../common/Ipv4.hpp"

namespace net_map::scanner
{
    namespace category
    {
        inline constexpr const char *ROUTER = "Router (gateway)";
        inline constexpr const char *PRINTER = "Impresora";
        inline constexpr const char *TV = "TV / Consola";
        inline constexpr const char *SWITCH_AP = "Switch/AP";
        inline constexpr const char *INFRASTRUCTURE = "Infraestructura de red (posible switch/AP)";
        inline constexpr const char *IOT = "IoT Device";
        inline constexpr const char *MOBILE = "Móvil";
        inline constexpr const char *COMPUTER = "Ordenador";
        inline constexpr const char *UNKNOWN = "Desconocido";
    }

    struct InterfaceContext
    {
        std::string name;
        std::string address;
        common::Subnet subnet;
        std::optional<std::string> gateway;
    };

    struct DiscoveredHost
    {
        std::string ip;
        std::string mac;
        std::string vendor;
    };

    // A missing TTL means no echo reply, which is a normal outcome.
    struct ProbeResult
    {
        std::optional<int> ttl;
        std::vector<std::uint16_t> open_ports;
        std::vector<std::string> ssdp;
    };

    struct ProbedHost
    {
        DiscoveredHost host;
        ProbeResult result;
    };

    struct DeviceRecord
    {
        std::string ip;
        std::string mac;
        std::string vendor;
        std::optional<ProbeResult> probe; // absent for shallow scans
        std::string category;
    };

    struct SnapshotMeta
    {
        bool deep = false;
        double ts = 0.0;
    };

    struct ScanSnapshot
    {
        SnapshotMeta meta;
        std::vector<DeviceRecord> devices;
    };
}
