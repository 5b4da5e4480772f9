#include "Virtualization/operations/DhcpReservationReconciler.hpp"
#include "Utils/Ipv4Network.hpp"
#include "Utils/MacAddress.hpp"
#include "Virtualization/builder/DhcpHostBuilder.hpp"
#include "Virtualization/descriptor/NetworkDescriptor.hpp"

namespace {

bool sameMac(const std::string& a, const std::string& b) {
    if (!MacAddress::isValid(a) || !MacAddress::isValid(b)) return a == b;
    return MacAddress::normalize(a) == MacAddress::normalize(b);
}

} // namespace

std::string DhcpReservationReconciler::stripPrefix(const std::string& ip) {
    return ip.substr(0, ip.find('/'));
}

Result<DhcpReservationOutcome> DhcpReservationReconciler::reconcile(const DhcpReservationRequest& request,
                                                                    const ReconcileOptions& options) {
    return guardReconcile<DhcpReservationOutcome>("DHCP reservation on " + request.networkName,
                                                  [&] { return run(request, options); });
}

DhcpReservationOutcome DhcpReservationReconciler::run(const DhcpReservationRequest& request,
                                                      const ReconcileOptions& options) {
    DhcpReservationOutcome outcome;
    outcome.networkName = request.networkName;
    outcome.domainName = request.domainName;
    outcome.ipAddress = stripPrefix(request.ipAddress);
    outcome.macAddress = request.macAddress;

    if (!MacAddress::isValid(request.macAddress)) {
        throw InvalidInputException("Invalid MAC address format: " + request.macAddress);
    }
    if (!Ipv4Network::isValidAddress(outcome.ipAddress)) {
        throw InvalidInputException("Invalid IP address: " + request.ipAddress);
    }

    auto network = hypervisor.lookupNetwork(request.networkName);
    if (!network) throw NotFoundException("Network " + request.networkName + " does not exist");

    auto parsed = NetworkDescriptor::tryParse(network->xmlDesc());
    if (!parsed) throw LibvirtException("Cannot read descriptor of network " + request.networkName + ": " + parsed.error());

    if (!parsed->ip || !parsed->ip->hasDhcp) {
        outcome.skipped = true;
        outcome.warn("Network " + request.networkName + " does not have DHCP enabled - skipping DHCP reservation");
        outcome.msg = "Operation skipped - DHCP not enabled";
        return outcome;
    }

    const IpInfo& ip = *parsed->ip;
    bool inRange = false;
    if (!ip.address.empty() && !ip.netmask.empty()) {
        try {
            inRange = Ipv4Network::fromAddressAndNetmask(ip.address, ip.netmask).contains(outcome.ipAddress);
        } catch (const InvalidInputException& e) {
            VRLOG_DEBUG("Network {} has an unusable address block: {}", request.networkName, e.what());
        }
    }
    if (!inRange) throw InvalidInputException("IP address " + outcome.ipAddress + " is not within network range");

    const DhcpHost* byMac = nullptr;
    const DhcpHost* byIp = nullptr;
    for (const auto& host : ip.hosts) {
        if (!byMac && sameMac(host.mac, request.macAddress)) byMac = &host;
        if (!byIp && host.ip == outcome.ipAddress) byIp = &host;
    }
    if (byMac && byIp && byMac != byIp) {
        outcome.warn("MAC " + request.macAddress + " and IP " + outcome.ipAddress +
                     " match different reservations; updating the first one");
    }

    // first entry in document order that matches either key
    const DhcpHost* existing = nullptr;
    for (const auto& host : ip.hosts) {
        if (&host == byMac || &host == byIp) {
            existing = &host;
            break;
        }
    }

    NetworkUpdateCommand command = NetworkUpdateCommand::AddLast;
    if (existing) {
        if (sameMac(existing->mac, request.macAddress) && existing->ip == outcome.ipAddress &&
            existing->name == request.domainName) {
            outcome.msg = "DHCP reservation already up to date";
            return outcome;
        }
        command = NetworkUpdateCommand::Modify;
    }

    outcome.changed = true;
    if (options.dryRun) {
        outcome.msg = "Would update DHCP reservation";
        return outcome;
    }

    DhcpHostBuilder builder(DhcpHost{request.macAddress, outcome.ipAddress, request.domainName});
    const bool live = network->isActive();
    VRLOG_INFO("{} DHCP host {} -> {} on network {} (live: {})",
               command == NetworkUpdateCommand::Modify ? "Modifying" : "Adding", request.macAddress,
               outcome.ipAddress, request.networkName, live);
    try {
        network->updateDhcpHost(command, builder.build(), live);
    } catch (const LibvirtException& e) {
        throw LibvirtException(std::string("Failed to update DHCP reservation: ") + e.what());
    }
    outcome.msg = "DHCP reservation updated";
    return outcome;
}
