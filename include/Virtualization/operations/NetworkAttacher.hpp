#pragma once

#include "Virtualization/reconcile/ReconcileTypes.hpp"
#include <string>

struct NetworkAttachRequest {
    std::string domainName;
    std::string networkName;
    std::string macAddress;   // empty lets the hypervisor pick one
    bool connected{true};     // link state of the new interface
};

struct NetworkAttachOutcome : Outcome {
    std::string domainName;
    std::string networkName;
    std::string macAddress;
    bool alreadyAttached{false};
    bool domainRunning{false};
};

/**
 * @brief Adds a virtio interface on a virtual network to a domain.
 *
 * A running domain gets the device live and in its persistent definition,
 * a stopped one only in the definition. An existing interface on the same
 * network counts as attached; asking for a different MAC then is an error.
 */
class NetworkAttacher {
    IHypervisor& hypervisor;

    NetworkAttachOutcome run(const NetworkAttachRequest& request, const ReconcileOptions& options);

public:
    explicit NetworkAttacher(IHypervisor& hypervisor) : hypervisor(hypervisor) {}

    Result<NetworkAttachOutcome> attach(const NetworkAttachRequest& request,
                                        const ReconcileOptions& options = ReconcileOptions());
};
