#pragma once

#include "Core/config/HostDefaults.hpp"
#include "Virtualization/reconcile/ReconcileTypes.hpp"
#include <string>

struct DomainSpec {
    std::string name;
    unsigned int vcpus{1};
    unsigned long memoryMiB{512};
};

/**
 * @brief Creates and removes domain definitions.
 *
 * Creation defines a minimal domain without starting it. Removal stops the
 * domain (graceful first, forced after HostDefaults::removeShutdownTimeout),
 * drops its saved state and metadata, undefines it and deletes a leftover
 * NVRAM file.
 */
class DomainReconciler {
    IHypervisor& hypervisor;
    HostDefaults defaults;
    Sleeper sleeper;

    DomainOutcome create(const DomainSpec& spec, const ReconcileOptions& options);
    DomainOutcome remove(const std::string& name, const ReconcileOptions& options);

    // A transient domain counts as stopped once the hypervisor no longer knows it.
    void stop(IDomainHandle& domain, bool persistent);

public:
    DomainReconciler(IHypervisor& hypervisor, HostDefaults defaults = HostDefaults(), Sleeper sleeper = realSleeper());

    Result<DomainOutcome> ensurePresent(const DomainSpec& spec, const ReconcileOptions& options = ReconcileOptions());
    Result<DomainOutcome> ensureAbsent(const std::string& name, const ReconcileOptions& options = ReconcileOptions());
};
