#pragma once

#include "Core/config/HostDefaults.hpp"
#include "Virtualization/reconcile/ReconcileTypes.hpp"
#include <string>
#include <vector>

struct CloneRequest {
    std::string sourceName;
    std::string cloneName;
    bool linked{false};        // copy-on-write against the source volume, qcow2 only
    std::string targetPool;    // empty keeps each volume in its own pool
    bool start{true};
};

struct ClonedVolume {
    std::string name;
    std::string path;
    std::string type;   // full or cow
    std::string pool;
};

struct CloneOutcome : Outcome {
    std::string cloneName;
    std::string uuid;
    std::vector<ClonedVolume> storage;
};

/**
 * @brief Clones a domain together with its disk volumes.
 *
 * Every device='disk' with a file or block source is copied; CD-ROMs and
 * other devices keep pointing at the original. When a volume copy fails,
 * the copies made so far are deleted and no domain is defined. A failed
 * start of the clone does not undo the clone.
 */
class DomainCloner {
    IHypervisor& hypervisor;
    HostDefaults defaults;

    CloneOutcome run(const CloneRequest& request, const ReconcileOptions& options);

    ClonedVolume cloneVolume(const IStorageVolumeHandle& source, const std::string& cloneName,
                             IStoragePoolHandle& pool, bool linked, Outcome& outcome);

    // Deletes volumes created by this call; returns the failures.
    std::string rollback(const std::vector<ClonedVolume>& created);

public:
    DomainCloner(IHypervisor& hypervisor, HostDefaults defaults = HostDefaults())
        : hypervisor(hypervisor), defaults(std::move(defaults)) {}

    Result<CloneOutcome> clone(const CloneRequest& request, const ReconcileOptions& options = ReconcileOptions());

    // basename of @p sourcePath with every occurrence of @p sourceName replaced by @p cloneName
    [[nodiscard]] static std::string cloneVolumeName(const std::string& sourcePath, const std::string& sourceName,
                                                     const std::string& cloneName);
};
