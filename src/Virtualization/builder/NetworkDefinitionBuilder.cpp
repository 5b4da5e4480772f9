#include "Virtualization/builder/NetworkDefinitionBuilder.hpp"
#include "Utils/Ipv4Network.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <pugixml.hpp>

std::string NetworkDefinitionBuilder::build() {
    if (name.empty()) throw InvalidInputException("Network name is required");
    if (forwardMode != "nat" && forwardMode != "route" && forwardMode != "isolated") {
        throw InvalidInputException("Invalid network type: " + forwardMode);
    }
    if (!cidr.empty()) {
        const auto network = Ipv4Network::fromCidr(cidr);
        for (const auto* bound : {&dhcpStart, &dhcpEnd}) {
            if (bound->empty()) continue;
            if (!Ipv4Network::isValidAddress(*bound)) {
                throw InvalidInputException("Invalid DHCP range address: " + *bound);
            }
            if (!network.contains(*bound)) {
                throw InvalidInputException("DHCP range address " + *bound + " is outside " + network.toString());
            }
        }
    } else if (!dhcpStart.empty() || !dhcpEnd.empty()) {
        throw InvalidInputException("A DHCP range requires a CIDR");
    }
    return IXmlBuilderBase::build();
}

void NetworkDefinitionBuilder::buildDocument() {
    auto root = doc.append_child("network");
    root.append_child("name").text() = name.c_str();

    auto bridge = root.append_child("bridge");
    if (!bridgeName.empty()) bridge.append_attribute("name") = bridgeName.c_str();
    bridge.append_attribute("stp") = stp ? "on" : "off";
    bridge.append_attribute("delay") = delay;

    if (mtu) root.append_child("mtu").append_attribute("size") = *mtu;

    if (!domainName.empty()) root.append_child("domain").append_attribute("name") = domainName.c_str();

    if (forwardMode != "isolated") {
        root.append_child("forward").append_attribute("mode") = forwardMode.c_str();
    }

    if (!cidr.empty()) {
        const auto network = Ipv4Network::fromCidr(cidr);
        // the gateway takes network+1; the default DHCP range runs network+10 .. broadcast-1
        if (network.prefixLength() > 30) {
            throw InvalidInputException("Network " + cidr + " has no room for a gateway address");
        }
        if (dhcpEnabled && (dhcpStart.empty() || dhcpEnd.empty()) && network.prefixLength() > 28) {
            throw InvalidInputException("Network " + cidr + " is too small for the default DHCP range");
        }
        auto ip = root.append_child("ip");
        ip.append_attribute("address") = network.networkOffset(1).c_str();
        ip.append_attribute("netmask") = network.netmask().c_str();

        if (dhcpEnabled) {
            const std::string start = dhcpStart.empty() ? network.networkOffset(10) : dhcpStart;
            const std::string end = dhcpEnd.empty() ? network.broadcastOffset(1) : dhcpEnd;
            auto range = ip.append_child("dhcp").append_child("range");
            range.append_attribute("start") = start.c_str();
            range.append_attribute("end") = end.c_str();
        }
    }

    if (dnsEnabled) {
        auto dns = root.append_child("dns");
        for (const auto& forwarder : dnsForwarders) {
            dns.append_child("forwarder").append_attribute("addr") = forwarder.c_str();
        }
        for (const auto& host : dnsHosts) {
            auto hostNode = dns.append_child("host");
            hostNode.append_attribute("ip") = host.ip.c_str();
            for (const auto& hostname : host.hostnames) {
                hostNode.append_child("hostname").text() = hostname.c_str();
            }
        }
    }
}

NetworkDefinitionBuilder& NetworkDefinitionBuilder::setName(std::string_view name) {
    this->name = name;
    return *this;
}

NetworkDefinitionBuilder& NetworkDefinitionBuilder::setType(std::string_view type) {
    this->forwardMode = type == "routed" ? "route" : std::string(type);
    return *this;
}

NetworkDefinitionBuilder& NetworkDefinitionBuilder::setBridge(std::string_view bridge) {
    this->bridgeName = bridge;
    return *this;
}

NetworkDefinitionBuilder& NetworkDefinitionBuilder::setStp(bool enabled) {
    this->stp = enabled;
    return *this;
}

NetworkDefinitionBuilder& NetworkDefinitionBuilder::setDelay(unsigned int seconds) {
    this->delay = seconds;
    return *this;
}

NetworkDefinitionBuilder& NetworkDefinitionBuilder::setMtu(unsigned int value) {
    this->mtu = value;
    return *this;
}

NetworkDefinitionBuilder& NetworkDefinitionBuilder::setDomainName(std::string_view domain) {
    this->domainName = domain;
    return *this;
}

NetworkDefinitionBuilder& NetworkDefinitionBuilder::setCidr(std::string_view value) {
    this->cidr = value;
    return *this;
}

NetworkDefinitionBuilder& NetworkDefinitionBuilder::setDhcp(bool enabled, std::string_view start, std::string_view end) {
    this->dhcpEnabled = enabled;
    this->dhcpStart = start;
    this->dhcpEnd = end;
    return *this;
}

NetworkDefinitionBuilder& NetworkDefinitionBuilder::setDnsEnabled(bool enabled) {
    this->dnsEnabled = enabled;
    return *this;
}

NetworkDefinitionBuilder& NetworkDefinitionBuilder::addDnsForwarder(std::string_view address) {
    dnsForwarders.emplace_back(address);
    return *this;
}

NetworkDefinitionBuilder& NetworkDefinitionBuilder::addDnsHost(DnsHost host) {
    dnsHosts.push_back(std::move(host));
    return *this;
}
