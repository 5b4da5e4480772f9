#pragma once

#include "Virtualization/inspect/ResourceInfo.hpp"
#include <expected>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Read-only view of the domains on one hypervisor.
 *
 * Missing domains and domains whose state cannot be read both come back as
 * absent; the reason is only logged.
 */
class DomainInspector {
    const IHypervisor& hypervisor;

public:
    explicit DomainInspector(const IHypervisor& hypervisor) : hypervisor(hypervisor) {}

    [[nodiscard]] std::expected<DomainInfo, LookupFailure> lookup(const std::string& name) const;

    [[nodiscard]] std::optional<DomainInfo> getInfo(const std::string& name) const;
    [[nodiscard]] std::vector<DomainInfo> getByPattern(const std::string& pattern) const;
    [[nodiscard]] bool exists(const std::string& name) const;

    // Throws LibvirtException when the handle cannot be queried.
    [[nodiscard]] static DomainInfo describe(const IDomainHandle& domain);
};
