#include "Virtualization/reconcile/NetworkReconciler.hpp"
#include "Virtualization/builder/NetworkDefinitionBuilder.hpp"
#include "Virtualization/inspect/NetworkInspector.hpp"

std::string NetworkReconciler::buildDescriptor(const NetworkSpec& spec) {
    NetworkDefinitionBuilder builder;
    builder.setName(spec.name)
        .setType(spec.type)
        .setStp(spec.stp)
        .setDelay(spec.delay)
        .setDhcp(spec.dhcpEnabled, spec.dhcpStart, spec.dhcpEnd)
        .setDnsEnabled(spec.dnsEnabled);
    if (!spec.bridge.empty()) builder.setBridge(spec.bridge);
    if (spec.mtu) builder.setMtu(*spec.mtu);
    if (!spec.domainName.empty()) builder.setDomainName(spec.domainName);
    if (!spec.cidr.empty()) builder.setCidr(spec.cidr);
    for (const auto& forwarder : spec.dnsForwarders) builder.addDnsForwarder(forwarder);
    for (const auto& host : spec.dnsHosts) builder.addDnsHost(host);
    return builder.build();
}

Result<NetworkOutcome> NetworkReconciler::reconcile(const NetworkSpec& spec, const ReconcileOptions& options) {
    return guardReconcile<NetworkOutcome>("Managing network " + spec.name, [&] { return run(spec, options); });
}

bool NetworkReconciler::ensureState(INetworkHandle& network, bool active, bool autostart, bool dryRun) {
    bool changed = false;
    if (network.isActive() != active) {
        changed = true;
        if (!dryRun) {
            VRLOG_INFO("{} network {}", active ? "Starting" : "Stopping", network.name());
            if (active) {
                network.create();
            } else {
                network.destroy();
            }
        }
    }
    if (network.autostart() != autostart) {
        changed = true;
        if (!dryRun) {
            VRLOG_INFO("Setting autostart of network {} to {}", network.name(), autostart);
            network.setAutostart(autostart);
        }
    }
    return changed;
}

NetworkOutcome NetworkReconciler::run(const NetworkSpec& spec, const ReconcileOptions& options) {
    NetworkOutcome outcome;
    const std::string& name = spec.name;
    if (name.empty()) throw InvalidInputException("Network name is required");

    std::string descriptor;
    if (spec.state != ResourceState::Absent) descriptor = buildDescriptor(spec);

    auto network = hypervisor.lookupNetwork(name);

    if (spec.state == ResourceState::Absent) {
        if (!network) {
            outcome.msg = "Network " + name + " does not exist";
            return outcome;
        }
        outcome.changed = true;
        if (options.dryRun) {
            outcome.msg = "Would remove network " + name;
            return outcome;
        }
        if (network->isActive()) {
            VRLOG_INFO("Stopping network {}", name);
            network->destroy();
        }
        VRLOG_INFO("Undefining network {}", name);
        network->undefine();
        outcome.msg = "Network " + name + " removed";
        return outcome;
    }

    if (!network) {
        if (spec.state == ResourceState::Inactive) {
            outcome.msg = "Network " + name + " does not exist";
            return outcome;
        }
        outcome.changed = true;
        if (options.dryRun) {
            outcome.msg = "Would create network " + name;
            return outcome;
        }
        VRLOG_INFO("Defining network {}", name);
        network = hypervisor.defineNetwork(descriptor);
        outcome.msg = "Network " + name + " created";
    }

    if (spec.state == ResourceState::Active || spec.state == ResourceState::Inactive) {
        const bool wantActive = spec.state == ResourceState::Active;
        if (ensureState(*network, wantActive, spec.autostart, options.dryRun)) {
            outcome.changed = true;
            outcome.msg = options.dryRun ? "Would change network " + name + " state to " + std::string(toString(spec.state))
                                         : "Network " + name + " state changed to " + std::string(toString(spec.state));
        } else if (outcome.msg.empty()) {
            outcome.msg = "Network " + name + " is already " + std::string(toString(spec.state));
        }
    } else if (spec.dhcpEnabled) {
        // a present network with DHCP is brought up as well
        if (ensureState(*network, true, spec.autostart, options.dryRun)) outcome.changed = true;
        outcome.msg = options.dryRun && outcome.changed ? "Would activate network " + name : "Network " + name + " is active";
    } else if (outcome.msg.empty()) {
        outcome.msg = "Network " + name + " is present";
    }

    outcome.networkInfo = NetworkInspector::describe(*network);
    return outcome;
}

Result<RefreshOutcome> NetworkReconciler::restartActiveNetworks(const std::optional<std::string>& name,
                                                                const ReconcileOptions& options) {
    return guardReconcile<RefreshOutcome>("Restarting networks", [&] { return restart(name, options); });
}

RefreshOutcome NetworkReconciler::restart(const std::optional<std::string>& name, const ReconcileOptions& options) {
    std::vector<std::string> names;
    if (name) {
        if (!hypervisor.lookupNetwork(*name)) throw NotFoundException("Network " + *name + " does not exist");
        names.push_back(*name);
    } else {
        names = hypervisor.listNetworkNames();
    }

    RefreshOutcome outcome;
    std::string failures;
    for (const auto& networkName : names) {
        try {
            auto network = hypervisor.lookupNetwork(networkName);
            if (!network) continue;
            if (network->isActive()) {
                outcome.changed = true;
                if (!options.dryRun) {
                    VRLOG_INFO("Restarting network {}", networkName);
                    network->destroy();
                    network->create();
                }
            }
            outcome.refreshed.push_back(networkName);
        } catch (const LibvirtException& e) {
            if (!failures.empty()) failures += "; ";
            failures += networkName + ": " + e.what();
        }
    }

    if (!failures.empty()) throw PartialFailureException("Failed to refresh networks: " + failures);

    std::string joined;
    for (const auto& n : outcome.refreshed) {
        if (!joined.empty()) joined += ", ";
        joined += n;
    }
    outcome.msg = (options.dryRun ? "Would restart networks: " : "Successfully refreshed networks: ") + joined;
    return outcome;
}
