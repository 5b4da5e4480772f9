#include "Core/interfaces/IHypervisor.hpp"

std::string_view toString(DomainState state) noexcept {
    switch (state) {
        case DomainState::NoState: return "nostate";
        case DomainState::Running: return "running";
        case DomainState::Blocked: return "blocked";
        case DomainState::Paused: return "paused";
        case DomainState::Shutdown: return "shutdown";
        case DomainState::Shutoff: return "shutoff";
        case DomainState::Crashed: return "crashed";
        case DomainState::PmSuspended: return "pmsuspended";
    }
    return "unknown";
}

std::string_view toString(PoolState state) noexcept {
    switch (state) {
        case PoolState::Inactive: return "inactive";
        case PoolState::Building: return "building";
        case PoolState::Running: return "active";
        case PoolState::Degraded: return "degraded";
        case PoolState::Inaccessible: return "inaccessible";
    }
    return "unknown";
}
