#pragma once

#include "Virtualization/descriptor/NetworkDescriptor.hpp"
#include "Virtualization/reconcile/ReconcileTypes.hpp"
#include <optional>
#include <string>
#include <vector>

struct NetworkSpec {
    std::string name;
    ResourceState state{ResourceState::Present};
    std::string type{"nat"};        // nat, route, isolated
    std::string bridge;
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
    bool autostart{true};
};

/**
 * @brief Converges one virtual network.
 *
 * present defines a missing network and, when DHCP is enabled, also
 * activates it and applies autostart. active/inactive toggle activation
 * and autostart independently; inactive never defines anything.
 */
class NetworkReconciler {
    IHypervisor& hypervisor;

    NetworkOutcome run(const NetworkSpec& spec, const ReconcileOptions& options);
    RefreshOutcome restart(const std::optional<std::string>& name, const ReconcileOptions& options);

    // true when activation or autostart had to change
    static bool ensureState(INetworkHandle& network, bool active, bool autostart, bool dryRun);

public:
    explicit NetworkReconciler(IHypervisor& hypervisor) : hypervisor(hypervisor) {}

    Result<NetworkOutcome> reconcile(const NetworkSpec& spec, const ReconcileOptions& options = ReconcileOptions());

    /**
     * @brief Destroys and recreates one or every active network.
     *
     * Inactive networks are left alone but still reported. Failures are
     * collected and reported together after every network was tried.
     */
    Result<RefreshOutcome> restartActiveNetworks(const std::optional<std::string>& name = std::nullopt,
                                                 const ReconcileOptions& options = ReconcileOptions());

    // Throws InvalidInputException on bad type, CIDR or DHCP bounds.
    [[nodiscard]] static std::string buildDescriptor(const NetworkSpec& spec);
};
