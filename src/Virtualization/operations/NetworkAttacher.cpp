#include "Virtualization/operations/NetworkAttacher.hpp"
#include "Utils/MacAddress.hpp"
#include "Virtualization/builder/InterfaceDeviceBuilder.hpp"
#include "Virtualization/descriptor/DomainDescriptor.hpp"

namespace {

// MAC of the first interface on @p network, empty string when it has none
std::optional<std::string> findAttachment(const IDomainHandle& domain, const std::string& network) {
    auto parsed = DomainDescriptor::tryParse(domain.xmlDesc());
    if (!parsed) throw LibvirtException("Failed to check network attachment: " + parsed.error());
    for (const auto& iface : parsed->interfaces) {
        if (iface.type == "network" && iface.sourceNetwork == network) return iface.mac;
    }
    return std::nullopt;
}

} // namespace

Result<NetworkAttachOutcome> NetworkAttacher::attach(const NetworkAttachRequest& request,
                                                     const ReconcileOptions& options) {
    return guardReconcile<NetworkAttachOutcome>(
        "Attaching network " + request.networkName + " to " + request.domainName,
        [&] { return run(request, options); });
}

NetworkAttachOutcome NetworkAttacher::run(const NetworkAttachRequest& request, const ReconcileOptions& options) {
    if (!request.macAddress.empty() && !MacAddress::isValid(request.macAddress)) {
        throw InvalidInputException("Invalid MAC address format: " + request.macAddress);
    }

    auto network = hypervisor.lookupNetwork(request.networkName);
    if (!network) throw NotFoundException("Network " + request.networkName + " does not exist");
    auto domain = hypervisor.lookupDomain(request.domainName);
    if (!domain) throw NotFoundException("Domain " + request.domainName + " does not exist");

    NetworkAttachOutcome outcome;
    outcome.domainName = request.domainName;
    outcome.networkName = request.networkName;
    outcome.domainRunning = domain->state() == DomainState::Running;

    if (auto existingMac = findAttachment(*domain, request.networkName)) {
        outcome.alreadyAttached = true;
        outcome.macAddress = *existingMac;
        if (!request.macAddress.empty() &&
            (existingMac->empty() || !MacAddress::isValid(*existingMac) ||
             MacAddress::normalize(*existingMac) != MacAddress::normalize(request.macAddress))) {
            throw InvalidInputException("Network already attached with different MAC address: " + *existingMac);
        }
        outcome.msg = "Network " + request.networkName + " already attached to " + request.domainName;
        return outcome;
    }

    outcome.changed = true;
    if (options.dryRun) {
        outcome.macAddress = request.macAddress;
        outcome.msg = "Would attach network " + request.networkName + " to " + request.domainName;
        return outcome;
    }

    InterfaceDeviceBuilder builder;
    builder.setDeviceType("network").setNetworkName(request.networkName).setModel("virtio").setLinkState(request.connected);
    if (!request.macAddress.empty()) builder.setMacAddress(MacAddress::normalize(request.macAddress));

    VRLOG_INFO("Attaching network {} to domain {} (live: {})", request.networkName, request.domainName,
               outcome.domainRunning);
    domain->attachDevice(builder.build(), outcome.domainRunning);

    if (request.macAddress.empty()) {
        outcome.macAddress = findAttachment(*domain, request.networkName).value_or("");
    } else {
        outcome.macAddress = MacAddress::normalize(request.macAddress);
    }
    outcome.msg = "Network " + request.networkName + " attached to " + request.domainName;
    return outcome;
}
