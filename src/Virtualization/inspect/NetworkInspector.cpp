#include "Virtualization/inspect/NetworkInspector.hpp"
#include "Utils/Glob.hpp"
#include "Utils/Ipv4Network.hpp"
#include "Utils/MacAddress.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

NetworkInfo NetworkInspector::describe(const INetworkHandle& network) {
    NetworkInfo info;
    info.name = network.name();
    info.uuid = network.uuid();
    info.active = network.isActive();
    info.persistent = network.isPersistent();
    info.autostart = network.autostart();

    auto parsed = NetworkDescriptor::tryParse(network.xmlDesc());
    if (!parsed) {
        VRLOG_DEBUG("Descriptor of network '{}' unreadable: {}", info.name, parsed.error());
        return info;
    }
    info.forwardMode = std::move(parsed->forwardMode);
    info.bridge = std::move(parsed->bridge);
    info.mtu = parsed->mtu;
    info.domainName = std::move(parsed->domainName);
    info.ip = std::move(parsed->ip);
    info.dns = std::move(parsed->dns);
    return info;
}

std::expected<NetworkInfo, LookupFailure> NetworkInspector::lookup(const std::string& name) const {
    try {
        auto network = hypervisor.lookupNetwork(name);
        if (!network) return std::unexpected(LookupFailure::notFound());
        return describe(*network);
    } catch (const VmException& e) {
        return std::unexpected(LookupFailure::malformed(e.what()));
    }
}

std::optional<NetworkInfo> NetworkInspector::getInfo(const std::string& name) const {
    return collapseLookup(lookup(name), "Network", name);
}

std::vector<NetworkInfo> NetworkInspector::getByPattern(const std::string& pattern) const {
    std::vector<NetworkInfo> result;
    std::vector<std::string> names;
    try {
        names = hypervisor.listNetworkNames();
    } catch (const VmException& e) {
        VRLOG_DEBUG("Listing networks failed: {}", e.what());
        return result;
    }
    for (const auto& name : Glob::filter(names, pattern)) {
        if (auto info = getInfo(name)) result.push_back(std::move(*info));
    }
    return result;
}

bool NetworkInspector::exists(const std::string& name) const {
    return getInfo(name).has_value();
}

std::optional<NetworkInfo> NetworkInspector::getByCidr(const std::string& cidr) const {
    const auto wanted = Ipv4Network::fromCidr(cidr, false);

    for (auto& info : getByPattern("*")) {
        if (!info.ip || info.ip->cidr.empty()) continue;
        try {
            if (Ipv4Network::fromCidr(info.ip->cidr, false) == wanted) return std::move(info);
        } catch (const InvalidInputException& e) {
            VRLOG_DEBUG("Network '{}' has unusable CIDR {}: {}", info.name, info.ip->cidr, e.what());
        }
    }
    return std::nullopt;
}

std::optional<std::string> NetworkInspector::reservedIpFor(const std::string& domainName,
                                                           const std::string& networkName) const {
    DomainDescriptor domain;
    try {
        auto handle = hypervisor.lookupDomain(domainName);
        if (!handle) return std::nullopt;
        auto parsed = DomainDescriptor::tryParse(handle->xmlDesc());
        if (!parsed) {
            reportLookupFailure("Domain", domainName, LookupFailure::malformed(parsed.error()));
            return std::nullopt;
        }
        domain = std::move(*parsed);
    } catch (const VmException& e) {
        reportLookupFailure("Domain", domainName, LookupFailure::malformed(e.what()));
        return std::nullopt;
    }

    std::string mac;
    for (const auto& iface : domain.interfaces) {
        if (iface.sourceNetwork == networkName && !iface.mac.empty()) {
            mac = iface.mac;
            break;
        }
    }
    if (mac.empty() || !MacAddress::isValid(mac)) return std::nullopt;

    auto network = getInfo(networkName);
    if (!network || !network->ip) return std::nullopt;

    const auto wanted = MacAddress::normalize(mac);
    for (const auto& host : network->ip->hosts) {
        if (MacAddress::isValid(host.mac) && MacAddress::normalize(host.mac) == wanted) return host.ip;
    }
    return std::nullopt;
}
