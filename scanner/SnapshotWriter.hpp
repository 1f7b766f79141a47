#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "Types.hpp"

namespace net_map::scanner
{
    // Document layout:
    //   {"_meta": {"deep": bool, "ts": float},
    //    "devices": [{"ip", "mac", "vendor", "ttl": int|null,
    //                 "open_ports": [int], "ssdp": [string], "class"}]}
    class SnapshotWriter
    {
    public:
        static nlohmann::json ToJson(const ScanSnapshot &snapshot);
        static ScanSnapshot FromJson(const nlohmann::json &doc);

        // Writes to "<path>.tmp" and renames over `path`. Throws
        // std::runtime_error on I/O failure.
        static void Write(const ScanSnapshot &snapshot, const std::string &path);
        static ScanSnapshot Read(const std::string &path);
    };
}
