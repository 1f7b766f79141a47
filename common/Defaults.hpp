#pragma once

#include <chrono>
#include <cstdint>

namespace net_map::defaults
{
    inline constexpr int WORKER_COUNT = 12;

    inline constexpr std::chrono::milliseconds DISCOVERY_TIMEOUT{3000};
    inline constexpr int DISCOVERY_RETRIES = 1;
    // Wider subnets are swept only across the block holding our own address.
    inline constexpr int WIDEST_SWEEP_PREFIX = 16;

    inline constexpr std::chrono::milliseconds ICMP_TIMEOUT{1000};
    inline constexpr std::chrono::milliseconds CONNECT_TIMEOUT{500};
    inline constexpr std::chrono::milliseconds SSDP_WINDOW{800};

    inline constexpr std::uint16_t SSDP_PORT = 1900;
    inline constexpr const char *SSDP_GROUP = "239.255.255.250";

    inline constexpr const char *SNAPSHOT_PATH = "netmap_results.json";
}
