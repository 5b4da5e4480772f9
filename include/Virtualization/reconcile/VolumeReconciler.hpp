#pragma once

#include "Core/config/HostDefaults.hpp"
#include "Virtualization/descriptor/PoolDescriptor.hpp"
#include "Virtualization/reconcile/PoolReconciler.hpp"
#include "Virtualization/reconcile/ReconcileTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class VolumeAction { Present, Absent, Resize, Import };

// "present", "absent", "resize" or "import"
[[nodiscard]] std::optional<VolumeAction> parseVolumeAction(std::string_view text) noexcept;

struct VolumeSpec {
    std::string pool;
    std::string name;
    VolumeAction action{VolumeAction::Present};
    std::uint64_t capacity{0};     // bytes; present and resize
    std::uint64_t allocation{0};   // bytes; 0 means thin
    std::string format{"raw"};
    std::string importPath;
    std::string importFormat{"qcow2"};
    PermissionSpec permissions{"0644", "", ""};
};

/**
 * @brief Creates, deletes, grows and imports volumes in a pool.
 *
 * Resizing only grows. File permissions are converged after every action
 * except removal, so an existing volume can still report a change.
 */
class VolumeReconciler {
    IHypervisor& hypervisor;
    HostDefaults defaults;
    PoolReconciler pools;

    VolumeOutcome run(const VolumeSpec& spec, const ReconcileOptions& options);
    VolumeOutcome create(IStoragePoolHandle& pool, const VolumeSpec& spec, const ReconcileOptions& options);
    VolumeOutcome resize(IStoragePoolHandle& pool, const VolumeSpec& spec, const ReconcileOptions& options);
    VolumeOutcome import(IStoragePoolHandle& pool, const VolumeSpec& spec, const ReconcileOptions& options);

    void upload(IStorageVolumeHandle& volume, const std::string& sourcePath, std::uint64_t length);
    bool applyPermissions(const IStorageVolumeHandle& volume, const VolumeSpec& spec,
                          const ReconcileOptions& options, VolumeOutcome& outcome) const;

public:
    VolumeReconciler(IHypervisor& hypervisor, HostDefaults defaults = HostDefaults(), Sleeper sleeper = realSleeper());

    Result<VolumeOutcome> reconcile(const VolumeSpec& spec, const ReconcileOptions& options = ReconcileOptions());
};
