#pragma once

#include "Core/config/HostDefaults.hpp"
#include "Virtualization/reconcile/ReconcileTypes.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>

enum class PowerTarget { Running, Poweroff, Reboot };

// "running", "poweroff" or "reboot"
[[nodiscard]] std::optional<PowerTarget> parsePowerTarget(std::string_view text) noexcept;

enum class PowerStatus {
    NoChange,
    Applied,
    ShutdownRequestedUnconfirmed  ///< graceful shutdown sent, SHUTOFF not seen before the timeout
};

[[nodiscard]] std::string_view toString(PowerStatus status) noexcept;

struct PowerRequest {
    std::string name;
    PowerTarget target{PowerTarget::Running};
    bool force{false};           ///< destroy instead of shutdown, reset instead of reboot
    bool forceOnTimeout{false};  ///< destroy when a graceful shutdown is not confirmed in time
};

struct PowerOutcome : Outcome {
    PowerStatus status{PowerStatus::NoChange};
    DomainState state{DomainState::NoState};
};

/**
 * @brief Drives a domain between SHUTOFF and RUNNING, or reboots it.
 *
 * Only a graceful poweroff waits; it polls the state every
 * WaitPolicy::interval until WaitPolicy::timeout.
 */
class DomainPowerReconciler {
    IHypervisor& hypervisor;
    WaitPolicy waitPolicy;
    Sleeper sleeper;

    PowerOutcome run(const PowerRequest& request, const ReconcileOptions& options);

public:
    DomainPowerReconciler(IHypervisor& hypervisor, WaitPolicy waitPolicy = WaitPolicy(),
                          Sleeper sleeper = realSleeper());

    // Fails when the domain does not exist.
    Result<PowerOutcome> apply(const PowerRequest& request, const ReconcileOptions& options = ReconcileOptions());

    // Polls @p done until it holds or the policy runs out. Returns the last observation.
    static bool waitUntil(const std::function<bool()>& done, const WaitPolicy& policy, const Sleeper& sleeper);
};
