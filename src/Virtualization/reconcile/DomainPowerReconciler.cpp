#include "Virtualization/reconcile/DomainPowerReconciler.hpp"
#include <chrono>

std::optional<PowerTarget> parsePowerTarget(std::string_view text) noexcept {
    if (text == "running") return PowerTarget::Running;
    if (text == "poweroff") return PowerTarget::Poweroff;
    if (text == "reboot") return PowerTarget::Reboot;
    return std::nullopt;
}

std::string_view toString(PowerStatus status) noexcept {
    switch (status) {
        case PowerStatus::NoChange: return "no_change";
        case PowerStatus::Applied: return "applied";
        case PowerStatus::ShutdownRequestedUnconfirmed: return "shutdown_requested_unconfirmed";
    }
    return "unknown";
}

DomainPowerReconciler::DomainPowerReconciler(IHypervisor& hypervisor, WaitPolicy waitPolicy, Sleeper sleeper)
    : hypervisor(hypervisor), waitPolicy(waitPolicy), sleeper(std::move(sleeper)) {}

bool DomainPowerReconciler::waitUntil(const std::function<bool()>& done, const WaitPolicy& policy,
                                      const Sleeper& sleeper) {
    for (unsigned tick = 0; tick < policy.ticks(); ++tick) {
        if (done()) return true;
        sleeper(policy.interval);
    }
    return done();
}

Result<PowerOutcome> DomainPowerReconciler::apply(const PowerRequest& request, const ReconcileOptions& options) {
    return guardReconcile<PowerOutcome>("Power state of domain " + request.name,
                                        [&] { return run(request, options); });
}

PowerOutcome DomainPowerReconciler::run(const PowerRequest& request, const ReconcileOptions& options) {
    auto domain = hypervisor.lookupDomain(request.name);
    if (!domain) throw NotFoundException("Domain " + request.name + " does not exist");

    PowerOutcome outcome;
    const DomainState current = domain->state();
    outcome.state = current;
    const std::string& name = request.name;

    switch (request.target) {
        case PowerTarget::Running:
            if (current == DomainState::Running) {
                outcome.msg = "Domain " + name + " is already running";
                return outcome;
            }
            outcome.changed = true;
            outcome.status = PowerStatus::Applied;
            if (options.dryRun) {
                outcome.msg = "Would start domain " + name;
                return outcome;
            }
            VRLOG_INFO("Starting domain {}", name);
            domain->create();
            outcome.msg = "Domain " + name + " started";
            break;

        case PowerTarget::Poweroff:
            if (current == DomainState::Shutoff) {
                outcome.msg = "Domain " + name + " is already shut off";
                return outcome;
            }
            outcome.changed = true;
            outcome.status = PowerStatus::Applied;
            if (options.dryRun) {
                outcome.msg = std::string("Would ") + (request.force ? "force off" : "shut down") + " domain " + name;
                return outcome;
            }
            if (request.force) {
                VRLOG_INFO("Destroying domain {}", name);
                domain->destroy();
                outcome.msg = "Domain " + name + " forced off";
                break;
            }
            VRLOG_INFO("Requesting shutdown of domain {}", name);
            domain->shutdown();
            if (waitUntil([&] { return domain->state() == DomainState::Shutoff; }, waitPolicy, sleeper)) {
                outcome.msg = "Domain " + name + " shut down";
            } else if (request.forceOnTimeout) {
                VRLOG_INFO("Shutdown of {} not confirmed, destroying", name);
                domain->destroy();
                outcome.msg = "Domain " + name + " did not shut down in time and was forced off";
            } else {
                outcome.status = PowerStatus::ShutdownRequestedUnconfirmed;
                outcome.msg = "Shutdown of domain " + name + " requested but not confirmed within " +
                              std::to_string(std::chrono::duration_cast<std::chrono::seconds>(waitPolicy.timeout).count()) + "s";
                outcome.warn(outcome.msg);
            }
            break;

        case PowerTarget::Reboot:
            if (current != DomainState::Running) {
                outcome.msg = "Domain " + name + " is not running, reboot skipped";
                return outcome;
            }
            outcome.changed = true;
            outcome.status = PowerStatus::Applied;
            if (options.dryRun) {
                outcome.msg = std::string("Would ") + (request.force ? "reset" : "reboot") + " domain " + name;
                return outcome;
            }
            if (request.force) {
                VRLOG_INFO("Resetting domain {}", name);
                domain->reset();
                outcome.msg = "Domain " + name + " reset";
            } else {
                VRLOG_INFO("Rebooting domain {}", name);
                domain->reboot();
                outcome.msg = "Domain " + name + " rebooted";
            }
            break;
    }

    outcome.state = domain->state();
    return outcome;
}
