#pragma once

#include "Virtualization/descriptor/DomainDescriptor.hpp"
#include "Virtualization/reconcile/ReconcileTypes.hpp"
#include <string>
#include <vector>

struct VolumeAttachRequest {
    std::string domainName;
    std::string poolName;
    std::vector<std::string> volumes;
};

struct AttachedVolume {
    std::string name;
    std::string type;     // disk or cdrom
    std::string target;   // vdb, sda ...
    std::string bus;
    bool persistent{true};
};

struct VolumeAttachOutcome : Outcome {
    std::vector<AttachedVolume> attachedVolumes;
    std::vector<std::string> alreadyAttached;
    std::string domainState;
};

/**
 * @brief Attaches pool volumes to a domain.
 *
 * ISO volumes become read-only SATA CD-ROMs (a SATA controller is added
 * first when the domain has none), everything else a virtio disk. Target
 * names are the lowest free letter for their prefix, re-read from the
 * domain before each attachment.
 */
class VolumeAttacher {
    IHypervisor& hypervisor;

    VolumeAttachOutcome run(const VolumeAttachRequest& request, const ReconcileOptions& options);

public:
    explicit VolumeAttacher(IHypervisor& hypervisor) : hypervisor(hypervisor) {}

    Result<VolumeAttachOutcome> attach(const VolumeAttachRequest& request,
                                       const ReconcileOptions& options = ReconcileOptions());

    // vda, vdb ... for prefix "vd"; throws StorageException once 'z' is taken
    [[nodiscard]] static std::string nextTargetDev(const DomainDescriptor& domain, const std::string& prefix);

    // Format "iso", or a ".iso" name when the descriptor carries no format.
    [[nodiscard]] static bool isIsoVolume(const IStorageVolumeHandle& volume);
};
