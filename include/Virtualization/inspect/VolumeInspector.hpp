#pragma once

#include "Virtualization/inspect/ResourceInfo.hpp"
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Read-only view of the volumes in a pool.
 *
 * Volumes are addressed as "pool/volume". The pool is refreshed before every
 * lookup because its volume list goes stale when files change behind the
 * hypervisor's back.
 */
class VolumeInspector {
    const IHypervisor& hypervisor;

    // nullptr when the pool is missing; a failed refresh is only logged
    [[nodiscard]] std::unique_ptr<IStoragePoolHandle> refreshedPool(const std::string& poolName) const;

public:
    explicit VolumeInspector(const IHypervisor& hypervisor) : hypervisor(hypervisor) {}

    /**
     * @brief Splits "pool/volume" at the first '/'.
     * @throws InvalidInputException when there is no '/' or either side is empty
     */
    [[nodiscard]] static std::pair<std::string, std::string> parseVolumeKey(const std::string& key);

    [[nodiscard]] std::expected<VolumeInfo, LookupFailure> lookup(const std::string& poolName,
                                                                  const std::string& volumeName) const;

    [[nodiscard]] std::optional<VolumeInfo> getInfo(const std::string& poolName, const std::string& volumeName) const;
    [[nodiscard]] std::optional<VolumeInfo> getInfo(const std::string& key) const;

    // "pool/pattern"; the pattern applies to volume names only
    [[nodiscard]] std::vector<VolumeInfo> getByPattern(const std::string& key) const;
    [[nodiscard]] std::vector<VolumeInfo> getByPattern(const std::string& poolName, const std::string& pattern) const;

    [[nodiscard]] bool exists(const std::string& poolName, const std::string& volumeName) const;

    [[nodiscard]] static VolumeInfo describe(const IStorageVolumeHandle& volume, const std::string& poolName);
};
