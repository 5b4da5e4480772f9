#pragma once

#include "System/Logger.hpp"
#include "Utils/Result.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/inspect/ResourceInfo.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct ReconcileOptions {
    bool dryRun{false};
};

// Declared target for networks and pools.
enum class ResourceState { Present, Absent, Active, Inactive };

[[nodiscard]] std::optional<ResourceState> parseResourceState(std::string_view text) noexcept;
[[nodiscard]] std::string_view toString(ResourceState state) noexcept;

/**
 * @brief What one reconciliation call did.
 *
 * changed == false means the live state was already converged. Non-fatal
 * problems end up in warnings and are also logged.
 */
struct Outcome {
    bool changed{false};
    std::string msg;
    std::vector<std::string> warnings;

    void warn(std::string text) {
        VRLOG_WARN("{}", text);
        warnings.push_back(std::move(text));
    }
};

struct DomainOutcome : Outcome {
    std::optional<DomainInfo> domainInfo;
};

struct NetworkOutcome : Outcome {
    std::optional<NetworkInfo> networkInfo;
};

struct PoolOutcome : Outcome {
    std::optional<PoolInfo> poolInfo;
};

struct VolumeOutcome : Outcome {
    std::optional<VolumeInfo> volumeInfo;
};

struct RefreshOutcome : Outcome {
    std::vector<std::string> refreshed;
};

/**
 * @brief Runs @p body and turns a VmException into the error side of a Result.
 *
 * Anything that is not a VmException is a programming error and propagates.
 */
template <typename T, typename Fn>
Result<T> guardReconcile(std::string_view operation, Fn&& body) {
    try {
        return Result<T>{body()};
    } catch (const VmException& e) {
        VRLOG_ERROR("{} failed: {}", operation, e.what());
        return Result<T>{std::string(e.what())};
    }
}
