#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

struct DhcpHost {
    std::string mac;
    std::string ip;
    std::string name;

    bool operator==(const DhcpHost&) const = default;
};

struct DnsHost {
    std::string ip;
    std::vector<std::string> hostnames;
};

struct BridgeInfo {
    std::string name;
    bool stp{true};
    unsigned int delay{0};
};

struct IpInfo {
    std::string address;
    std::string netmask;
    std::string cidr;        // derived; empty when address or netmask is unusable
    std::string dhcpStart;
    std::string dhcpEnd;
    bool hasDhcp{false};     // an <ip><dhcp> element is present
    std::vector<DhcpHost> hosts;
};

struct DnsInfo {
    bool enabled{true};
    std::vector<std::string> forwarders;
    std::vector<DnsHost> hosts;
};

/**
 * @brief Semantic view of a network descriptor. Only the first <ip> element is read.
 */
struct NetworkDescriptor {
    std::string name;
    std::string uuid;
    std::string forwardMode;          // empty for isolated networks
    std::optional<BridgeInfo> bridge;
    std::optional<unsigned int> mtu;
    std::string domainName;
    std::optional<IpInfo> ip;
    DnsInfo dns;

    [[nodiscard]] static std::expected<NetworkDescriptor, std::string> tryParse(const std::string& xml);
    [[nodiscard]] static NetworkDescriptor fromXML(const std::string& xml);
};
