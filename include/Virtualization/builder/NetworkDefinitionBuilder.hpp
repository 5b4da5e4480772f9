#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include "Virtualization/descriptor/NetworkDescriptor.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Builder for a network definition
 *
 * With a CIDR the gateway is network+1 and, when DHCP is enabled, the
 * range defaults to network+10 .. broadcast-1. Isolated networks carry no
 * <forward> element.
 */
class NetworkDefinitionBuilder : public IXmlBuilderBase {
private:
    void buildDocument() override;

    std::string name;
    std::string forwardMode{"nat"};
    std::string bridgeName;
    bool stp{true};
    unsigned int delay{0};
    std::optional<unsigned int> mtu;
    std::string domainName;
    std::string cidr;
    bool dhcpEnabled{true};
    std::string dhcpStart;
    std::string dhcpEnd;
    bool dnsEnabled{true};
    std::vector<std::string> dnsForwarders;
    std::vector<DnsHost> dnsHosts;

public:
    NetworkDefinitionBuilder() = default;
    ~NetworkDefinitionBuilder() override = default;

    NetworkDefinitionBuilder& setName(std::string_view name);
    // nat, route (or routed), isolated
    NetworkDefinitionBuilder& setType(std::string_view type);
    NetworkDefinitionBuilder& setBridge(std::string_view bridge);
    NetworkDefinitionBuilder& setStp(bool enabled);
    NetworkDefinitionBuilder& setDelay(unsigned int seconds);
    NetworkDefinitionBuilder& setMtu(unsigned int mtu);
    NetworkDefinitionBuilder& setDomainName(std::string_view domain);
    NetworkDefinitionBuilder& setCidr(std::string_view cidr);
    NetworkDefinitionBuilder& setDhcp(bool enabled, std::string_view start = {}, std::string_view end = {});
    NetworkDefinitionBuilder& setDnsEnabled(bool enabled);
    NetworkDefinitionBuilder& addDnsForwarder(std::string_view address);
    NetworkDefinitionBuilder& addDnsHost(DnsHost host);

    /**
     * @throws InvalidInputException for an unknown type, a malformed CIDR or
     *         DHCP bounds that are not addresses inside the CIDR
     */
    [[nodiscard]] std::string build();
};
