#include "Virtualization/reconcile/ReconcileTypes.hpp"

std::optional<ResourceState> parseResourceState(std::string_view text) noexcept {
    if (text == "present") return ResourceState::Present;
    if (text == "absent") return ResourceState::Absent;
    if (text == "active") return ResourceState::Active;
    if (text == "inactive") return ResourceState::Inactive;
    return std::nullopt;
}

std::string_view toString(ResourceState state) noexcept {
    switch (state) {
        case ResourceState::Present: return "present";
        case ResourceState::Absent: return "absent";
        case ResourceState::Active: return "active";
        case ResourceState::Inactive: return "inactive";
    }
    return "unknown";
}
