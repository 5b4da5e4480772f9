#include "Virtualization/reconcile/DomainReconciler.hpp"
#include "Virtualization/builder/DomainDefinitionBuilder.hpp"
#include "Virtualization/inspect/DomainInspector.hpp"
#include "Virtualization/reconcile/DomainPowerReconciler.hpp"
#include <filesystem>
#include <system_error>

DomainReconciler::DomainReconciler(IHypervisor& hypervisor, HostDefaults defaults, Sleeper sleeper)
    : hypervisor(hypervisor), defaults(std::move(defaults)), sleeper(std::move(sleeper)) {}

Result<DomainOutcome> DomainReconciler::ensurePresent(const DomainSpec& spec, const ReconcileOptions& options) {
    return guardReconcile<DomainOutcome>("Creating domain " + spec.name, [&] { return create(spec, options); });
}

Result<DomainOutcome> DomainReconciler::ensureAbsent(const std::string& name, const ReconcileOptions& options) {
    return guardReconcile<DomainOutcome>("Removing domain " + name, [&] { return remove(name, options); });
}

DomainOutcome DomainReconciler::create(const DomainSpec& spec, const ReconcileOptions& options) {
    DomainOutcome outcome;
    if (auto existing = hypervisor.lookupDomain(spec.name)) {
        outcome.msg = "Domain already exists";
        outcome.domainInfo = DomainInspector::describe(*existing);
        return outcome;
    }

    outcome.changed = true;
    if (options.dryRun) {
        outcome.msg = "Would create domain " + spec.name;
        return outcome;
    }

    DomainDefinitionBuilder builder(defaults);
    builder.setName(spec.name).setCpuCount(spec.vcpus).setMemoryMiB(spec.memoryMiB);
    const std::string xml = builder.build();

    VRLOG_INFO("Defining domain {} ({} vcpu, {} MiB)", spec.name, spec.vcpus, spec.memoryMiB);
    auto domain = hypervisor.defineDomain(xml);
    outcome.msg = "Domain created successfully";
    outcome.domainInfo = DomainInspector::describe(*domain);
    return outcome;
}

void DomainReconciler::stop(IDomainHandle& domain, bool persistent) {
    const std::string name = domain.name();
    const auto stopped = [&] {
        if (!persistent && !hypervisor.lookupDomain(name)) return true;
        return !domain.isActive();
    };
    try {
        VRLOG_INFO("Requesting shutdown of domain {}", name);
        domain.shutdown();
        const WaitPolicy policy{defaults.removeShutdownTimeout, defaults.pollInterval};
        DomainPowerReconciler::waitUntil(stopped, policy, sleeper);
    } catch (const LibvirtException& e) {
        VRLOG_DEBUG("Graceful shutdown of {} failed: {}", name, e.what());
    }
    if (!stopped()) {
        VRLOG_INFO("Destroying domain {}", name);
        domain.destroy();
    }
}

DomainOutcome DomainReconciler::remove(const std::string& name, const ReconcileOptions& options) {
    DomainOutcome outcome;
    auto domain = hypervisor.lookupDomain(name);
    if (!domain) {
        outcome.msg = "Domain does not exist";
        return outcome;
    }

    outcome.changed = true;
    if (options.dryRun) {
        outcome.msg = "Would remove domain " + name;
        return outcome;
    }

    // a transient domain is gone once stopped; it has no definition to undefine
    const bool persistent = domain->isPersistent();
    if (domain->isActive()) stop(*domain, persistent);

    if (persistent) {
        try {
            if (domain->hasManagedSaveImage()) domain->managedSaveRemove();
        } catch (const LibvirtException& e) {
            outcome.warn(std::string("Failed to remove managed save: ") + e.what());
        }

        try {
            domain->undefine(UndefineMode::Extended);
        } catch (const UnsupportedOperationException&) {
            outcome.warn("Advanced undefine flags not supported, falling back to basic undefine");
            try {
                domain->undefine(UndefineMode::Basic);
            } catch (const LibvirtException& e) {
                throw LibvirtException(std::string("Failed to undefine domain: ") + e.what());
            }
        }
        VRLOG_INFO("Domain {} undefined", name);
    } else {
        VRLOG_INFO("Transient domain {} destroyed", name);
    }

    const std::string nvram = defaults.nvramPathFor(name);
    std::error_code ec;
    if (std::filesystem::exists(nvram, ec)) {
        std::filesystem::remove(nvram, ec);
        if (ec) outcome.warn("Failed to remove NVRAM file: " + nvram + ": " + ec.message());
    }

    outcome.msg = "Domain and all associated resources removed successfully";
    return outcome;
}
