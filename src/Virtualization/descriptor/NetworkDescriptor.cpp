#include "Virtualization/descriptor/NetworkDescriptor.hpp"
#include "Virtualization/descriptor/XmlText.hpp"
#include "Utils/Ipv4Network.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <pugixml.hpp>

namespace {

std::string deriveCidr(const std::string& address, const std::string& netmask, const std::string& prefix) {
    try {
        if (!netmask.empty()) return Ipv4Network::fromAddressAndNetmask(address, netmask).toString();
        if (!prefix.empty()) return Ipv4Network::fromCidr(address + "/" + prefix, false).toString();
    } catch (const InvalidInputException&) {
        return {};
    }
    return {};
}

IpInfo parseIp(const pugi::xml_node& ipNode) {
    IpInfo ip;
    ip.address = ipNode.attribute("address").as_string();
    ip.netmask = ipNode.attribute("netmask").as_string();
    const std::string prefix = ipNode.attribute("prefix").as_string();
    if (!ip.address.empty()) ip.cidr = deriveCidr(ip.address, ip.netmask, prefix);
    if (ip.netmask.empty() && !ip.cidr.empty()) {
        ip.netmask = Ipv4Network::fromCidr(ip.cidr).netmask();
    }

    if (auto dhcp = ipNode.child("dhcp")) {
        ip.hasDhcp = true;
        if (auto range = dhcp.child("range")) {
            ip.dhcpStart = range.attribute("start").as_string();
            ip.dhcpEnd = range.attribute("end").as_string();
        }
        for (auto host : dhcp.children("host")) {
            ip.hosts.push_back(DhcpHost{host.attribute("mac").as_string(),
                                        host.attribute("ip").as_string(),
                                        host.attribute("name").as_string()});
        }
    }
    return ip;
}

} // namespace

std::expected<NetworkDescriptor, std::string> NetworkDescriptor::tryParse(const std::string& xml) {
    pugi::xml_document doc;
    if (auto error = loadXml(doc, xml); !error.empty()) return std::unexpected(error);

    const auto root = doc.child("network");
    if (!root) return std::unexpected(std::string("root element is not <network>"));

    NetworkDescriptor out;
    out.name = root.child_value("name");
    out.uuid = root.child_value("uuid");
    out.forwardMode = root.child("forward").attribute("mode").as_string();
    if (root.child("forward") && out.forwardMode.empty()) out.forwardMode = "nat";

    if (auto bridge = root.child("bridge")) {
        BridgeInfo info;
        info.name = bridge.attribute("name").as_string();
        info.stp = std::string(bridge.attribute("stp").as_string("on")) == "on";
        info.delay = bridge.attribute("delay").as_uint(0);
        out.bridge = info;
    }
    if (auto mtu = root.child("mtu")) out.mtu = mtu.attribute("size").as_uint(0);
    out.domainName = root.child("domain").attribute("name").as_string();

    if (auto ipNode = root.child("ip")) out.ip = parseIp(ipNode);

    if (auto dns = root.child("dns")) {
        out.dns.enabled = std::string(dns.attribute("enable").as_string("yes")) != "no";
        for (auto forwarder : dns.children("forwarder")) {
            out.dns.forwarders.emplace_back(forwarder.attribute("addr").as_string());
        }
        for (auto host : dns.children("host")) {
            DnsHost entry;
            entry.ip = host.attribute("ip").as_string();
            for (auto hostname : host.children("hostname")) entry.hostnames.emplace_back(hostname.child_value());
            out.dns.hosts.push_back(std::move(entry));
        }
    }
    return out;
}

NetworkDescriptor NetworkDescriptor::fromXML(const std::string& xml) {
    return tryParse(xml).value_or(NetworkDescriptor{});
}
