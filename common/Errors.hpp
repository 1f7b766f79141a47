#pragma once

#include <stdexcept>
#include <string>

namespace net_map::common
{
    class ScanError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Bad interface name, bad worker count, unreadable heuristics file.
    class ConfigurationError : public ScanError
    {
    public:
        using ScanError::ScanError;
    };

    class TopologyError : public ScanError
    {
    public:
        using ScanError::ScanError;
    };

    // Link-layer capture or send failed, usually a privilege problem.
    class DiscoveryError : public ScanError
    {
    public:
        using ScanError::ScanError;
    };

    class ScanCancelled : public ScanError
    {
    public:
        ScanCancelled() : ScanError("Scan cancelled") {}
    };
}
