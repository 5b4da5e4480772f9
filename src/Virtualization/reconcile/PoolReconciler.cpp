#include "Virtualization/reconcile/PoolReconciler.hpp"
#include "System/PermissionReconciler.hpp"
#include "Virtualization/builder/PoolDefinitionBuilder.hpp"
#include "Virtualization/inspect/PoolInspector.hpp"
#include <filesystem>

PoolReconciler::PoolReconciler(IHypervisor& hypervisor, RetryPolicy retryPolicy, Sleeper sleeper)
    : hypervisor(hypervisor), retryPolicy(retryPolicy), sleeper(std::move(sleeper)) {}

Result<PoolOutcome> PoolReconciler::reconcile(const PoolSpec& spec, const ReconcileOptions& options) {
    return guardReconcile<PoolOutcome>("Managing pool " + spec.name, [&] { return run(spec, options); });
}

bool PoolReconciler::ensureActive(IStoragePoolHandle& pool, bool dryRun) const {
    if (pool.isActive()) return false;
    if (dryRun) return true;

    const unsigned attempts = retryPolicy.attempts == 0 ? 1 : retryPolicy.attempts;
    std::string lastError = "Failed to activate pool";
    for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
        try {
            VRLOG_INFO("Activating pool {} (attempt {}/{})", pool.name(), attempt, attempts);
            pool.create();
            return true;
        } catch (const LibvirtException& e) {
            lastError = e.what();
            VRLOG_DEBUG("Activating pool {} failed: {}", pool.name(), lastError);
        }
        if (attempt < attempts) sleeper(retryPolicy.backoff);
    }
    throw LibvirtException(lastError);
}

PoolOutcome PoolReconciler::run(const PoolSpec& spec, const ReconcileOptions& options) {
    PoolOutcome outcome;
    const std::string& name = spec.name;
    if (name.empty()) throw InvalidInputException("Pool name is required");

    const PermissionReconciler permissions(options.dryRun);
    auto pool = hypervisor.lookupPool(name);

    if (spec.state == ResourceState::Absent) {
        if (!pool) {
            outcome.msg = "Pool already absent";
            return outcome;
        }
        outcome.changed = true;
        if (options.dryRun) {
            outcome.msg = "Would remove pool " + name;
            return outcome;
        }
        if (pool->isActive()) {
            VRLOG_INFO("Stopping pool {}", name);
            pool->destroy();
        }
        if (pool->isPersistent()) {
            VRLOG_INFO("Undefining pool {}", name);
            pool->undefine();
        }
        outcome.msg = "Pool " + name + " removed";
        return outcome;
    }

    std::string type = spec.type;
    std::string targetPath = spec.targetPath;

    if (!pool) {
        if (spec.state == ResourceState::Inactive) {
            outcome.msg = "Pool " + name + " does not exist";
            return outcome;
        }
        PoolDefinitionBuilder builder;
        builder.setName(name).setType(type).setTargetPath(targetPath).setSource(spec.source).setPermissions(spec.permissions);
        const std::string xml = builder.build();

        outcome.changed = true;
        if (options.dryRun) {
            outcome.msg = "Would create pool " + name;
            return outcome;
        }
        if (type == "dir") {
            try {
                permissions.createWithPermissions(targetPath, spec.permissions, true);
            } catch (const VmException& e) {
                throw StorageException(std::string("Failed to create target path: ") + e.what());
            }
        }
        VRLOG_INFO("Defining pool {} ({}) at {}", name, type, targetPath);
        pool = hypervisor.definePool(xml);
    } else if (type.empty() || targetPath.empty()) {
        const auto current = PoolDescriptor::fromXML(pool->xmlDesc());
        if (type.empty()) type = current.type;
        if (targetPath.empty()) targetPath = current.targetPath;
    }

    std::vector<std::string> steps;
    if (pool->autostart() != spec.autostart) {
        if (!options.dryRun) pool->setAutostart(spec.autostart);
        steps.emplace_back(spec.autostart ? "Enabled autostart" : "Disabled autostart");
    }
    const bool wantActive = spec.state != ResourceState::Inactive;
    if (wantActive) {
        if (ensureActive(*pool, options.dryRun)) steps.emplace_back("Activated pool");
    } else if (pool->isActive()) {
        if (!options.dryRun) {
            VRLOG_INFO("Stopping pool {}", name);
            pool->destroy();
        }
        steps.emplace_back("Deactivated pool");
    }
    if (!steps.empty()) {
        outcome.changed = true;
        std::string joined;
        for (const auto& step : steps) {
            if (!joined.empty()) joined += ", ";
            joined += step;
        }
        outcome.msg = options.dryRun ? "Would apply: " + joined : joined;
    }

    std::error_code ec;
    if (type == "dir" && !targetPath.empty() && std::filesystem::exists(targetPath, ec)) {
        if (permissions.manage(targetPath, spec.permissions, spec.recursivePermissions)) outcome.changed = true;
    }

    outcome.poolInfo = PoolInspector::describe(*pool);
    if (outcome.msg.empty()) outcome.msg = outcome.changed ? "Pool state updated" : "Pool is in desired state";
    return outcome;
}

Result<RefreshOutcome> PoolReconciler::refresh(const std::optional<std::string>& name, const ReconcileOptions& options) {
    return guardReconcile<RefreshOutcome>("Refreshing pools", [&] { return refreshPools(name, options); });
}

RefreshOutcome PoolReconciler::refreshPools(const std::optional<std::string>& name, const ReconcileOptions& options) {
    std::vector<std::string> names;
    if (name) {
        names.push_back(*name);
    } else {
        names = hypervisor.listPoolNames(true);
    }

    RefreshOutcome outcome;
    std::string failures;
    for (const auto& poolName : names) {
        try {
            auto pool = hypervisor.lookupPool(poolName);
            if (!pool) throw NotFoundException("Pool " + poolName + " does not exist");
            if (!pool->isActive()) continue;
            if (!options.dryRun) {
                VRLOG_INFO("Refreshing pool {}", poolName);
                pool->refresh();
            }
            outcome.refreshed.push_back(poolName);
        } catch (const VmException& e) {
            if (!failures.empty()) failures += "; ";
            failures += poolName + ": " + e.what();
        }
    }
    if (!failures.empty()) throw PartialFailureException("Failed to refresh pools: " + failures);

    std::string joined;
    for (const auto& n : outcome.refreshed) {
        if (!joined.empty()) joined += ", ";
        joined += n;
    }
    outcome.changed = !outcome.refreshed.empty();
    outcome.msg = (options.dryRun ? "Would refresh pools: " : "Successfully refreshed pools: ") + joined;
    return outcome;
}
