#include "Ipv4.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <tuple>

namespace net_map::common
{
    namespace
    {
        std::string HexDigits(const std::string &mac)
        {
            std::string digits;
            digits.reserve(mac.size());
            for (char c : mac)
            {
                if (c == ':' || c == '-' || c == '.')
                    continue;
                if (!std::isxdigit(static_cast<unsigned char>(c)))
                    return "";
                digits.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
            }
            return digits;
        }
    }

    std::optional<std::uint32_t> ParseIpv4(const std::string &ip)
    {
        in_addr addr{};
        if (inet_pton(AF_INET, ip.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string FormatIpv4(std::uint32_t address)
    {
        in_addr addr{};
        addr.s_addr = htonl(address);
        char buf[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr, buf, sizeof(buf));
        return std::string(buf);
    }

    int PrefixFromMask(std::uint32_t mask)
    {
        int prefix = 0;
        while (prefix < 32 && (mask & (0x80000000u >> prefix)))
            ++prefix;

        if (MaskFromPrefix(prefix) != mask)
            return -1;
        return prefix;
    }

    std::uint32_t MaskFromPrefix(int prefix)
    {
        if (prefix <= 0)
            return 0;
        if (prefix >= 32)
            return 0xFFFFFFFFu;
        return 0xFFFFFFFFu << (32 - prefix);
    }

    bool Subnet::Contains(const std::string &address) const
    {
        auto parsed = ParseIpv4(address);
        return parsed.has_value() && Contains(*parsed);
    }

    std::uint32_t Subnet::FirstHost() const
    {
        return prefix >= 31 ? network : network + 1;
    }

    std::uint32_t Subnet::LastHost() const
    {
        return prefix >= 31 ? Broadcast() : Broadcast() - 1;
    }

    std::string Subnet::ToString() const
    {
        return FormatIpv4(network) + "/" + std::to_string(prefix);
    }

    std::optional<Subnet> SubnetFromAddress(const std::string &address, const std::string &netmask)
    {
        auto ip = ParseIpv4(address);
        auto mask = ParseIpv4(netmask);
        if (!ip || !mask)
            return std::nullopt;

        int prefix = PrefixFromMask(*mask);
        if (prefix <= 0)
            return std::nullopt;

        Subnet subnet;
        subnet.network = *ip & *mask;
        subnet.prefix = prefix;
        return subnet;
    }

    bool AddressLess(const std::string &a, const std::string &b)
    {
        auto pa = ParseIpv4(a);
        auto pb = ParseIpv4(b);
        return std::make_tuple(!pa.has_value(), pa.value_or(0), a) <
               std::make_tuple(!pb.has_value(), pb.value_or(0), b);
    }

    std::optional<std::string> OuiKey(const std::string &mac)
    {
        std::string digits = HexDigits(mac);
        if (digits.size() < 6)
            return std::nullopt;
        return digits.substr(0, 6);
    }

    bool IsLocallyAdministered(const std::string &mac)
    {
        std::string digits = HexDigits(mac);
        if (digits.size() < 2)
            return false;
        int first = std::stoi(digits.substr(0, 2), nullptr, 16);
        return (first & 0x02) != 0;
    }
}
