#pragma once

#include "Virtualization/inspect/ResourceInfo.hpp"
#include <expected>
#include <optional>
#include <string>
#include <vector>

class PoolInspector {
    const IHypervisor& hypervisor;

public:
    explicit PoolInspector(const IHypervisor& hypervisor) : hypervisor(hypervisor) {}

    [[nodiscard]] std::expected<PoolInfo, LookupFailure> lookup(const std::string& name) const;

    [[nodiscard]] std::optional<PoolInfo> getInfo(const std::string& name) const;
    // Active and inactive pools.
    [[nodiscard]] std::vector<PoolInfo> getByPattern(const std::string& pattern) const;
    [[nodiscard]] bool exists(const std::string& name) const;

    [[nodiscard]] static PoolInfo describe(const IStoragePoolHandle& pool);
};
