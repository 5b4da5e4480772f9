#pragma once

#include "Core/config/HostDefaults.hpp"
#include "Virtualization/descriptor/PoolDescriptor.hpp"
#include "Virtualization/reconcile/ReconcileTypes.hpp"
#include <optional>
#include <string>

struct PoolSpec {
    std::string name;
    ResourceState state{ResourceState::Present};
    std::string type;         // required when the pool has to be defined
    std::string targetPath;   // required when the pool has to be defined
    PoolSource source;
    PermissionSpec permissions{"0755", "", ""};
    bool recursivePermissions{false};  // also converge everything under the target directory
    bool autostart{true};
};

/**
 * @brief Converges one storage pool.
 *
 * present implies active. Directory pools get their target directory
 * created before definition and its permissions re-applied on every call,
 * down the whole tree when recursivePermissions is set.
 * Activation is retried per RetryPolicy.
 */
class PoolReconciler {
    IHypervisor& hypervisor;
    RetryPolicy retryPolicy;
    Sleeper sleeper;

    PoolOutcome run(const PoolSpec& spec, const ReconcileOptions& options);
    RefreshOutcome refreshPools(const std::optional<std::string>& name, const ReconcileOptions& options);

public:
    PoolReconciler(IHypervisor& hypervisor, RetryPolicy retryPolicy = RetryPolicy(), Sleeper sleeper = realSleeper());

    Result<PoolOutcome> reconcile(const PoolSpec& spec, const ReconcileOptions& options = ReconcileOptions());

    // Re-reads the volume list of one pool, or of every active pool.
    Result<RefreshOutcome> refresh(const std::optional<std::string>& name = std::nullopt,
                                   const ReconcileOptions& options = ReconcileOptions());

    /**
     * @brief Starts @p pool unless it is running.
     * @return whether a start was needed
     * @throws LibvirtException with the last error once every attempt failed
     */
    bool ensureActive(IStoragePoolHandle& pool, bool dryRun = false) const;
};
