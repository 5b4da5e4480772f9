#pragma once

#include "Virtualization/reconcile/ReconcileTypes.hpp"
#include <string>

struct DhcpReservationRequest {
    std::string networkName;
    std::string domainName;   // used as the host entry's name
    std::string ipAddress;    // a "/prefix" suffix is ignored
    std::string macAddress;
};

struct DhcpReservationOutcome : Outcome {
    bool skipped{false};
    std::string networkName;
    std::string domainName;
    std::string ipAddress;
    std::string macAddress;
};

/**
 * @brief Keeps one <dhcp><host> entry of a network in line with a domain.
 *
 * The entry is changed through a targeted section update, never by
 * redefining the network. A network without a <dhcp> block is skipped
 * with a warning.
 */
class DhcpReservationReconciler {
    IHypervisor& hypervisor;

    DhcpReservationOutcome run(const DhcpReservationRequest& request, const ReconcileOptions& options);

public:
    explicit DhcpReservationReconciler(IHypervisor& hypervisor) : hypervisor(hypervisor) {}

    Result<DhcpReservationOutcome> reconcile(const DhcpReservationRequest& request,
                                             const ReconcileOptions& options = ReconcileOptions());

    [[nodiscard]] static std::string stripPrefix(const std::string& ip);
};
