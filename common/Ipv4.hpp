#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace net_map::common
{
    // Addresses are handled in host byte order.
    std::optional<std::uint32_t> ParseIpv4(const std::string &ip);
    std::string FormatIpv4(std::uint32_t address);

    // Returns -1 for a non-contiguous mask.
    int PrefixFromMask(std::uint32_t mask);
    std::uint32_t MaskFromPrefix(int prefix);

    struct Subnet
    {
        std::uint32_t network = 0;
        int prefix = 0;

        std::uint32_t Mask() const { return MaskFromPrefix(prefix); }
        std::uint32_t Broadcast() const { return network | ~Mask(); }
        bool Contains(std::uint32_t address) const { return (address & Mask()) == network; }
        bool Contains(const std::string &address) const;

        // Usable host addresses; /31 and /32 have no network/broadcast to skip.
        std::uint32_t FirstHost() const;
        std::uint32_t LastHost() const;

        std::string ToString() const;
    };

    std::optional<Subnet> SubnetFromAddress(const std::string &address, const std::string &netmask);

    // Numeric dotted-quad ordering; unparsable strings sort last, lexicographically.
    bool AddressLess(const std::string &a, const std::string &b);

    // Normalises "aa:bb:cc:...", "AA-BB-CC-..." or "aabb.cc..." to "AABBCC".
    std::optional<std::string> OuiKey(const std::string &mac);

    // U/L bit of the first octet.
    bool IsLocallyAdministered(const std::string &mac);
}
