#include "Virtualization/operations/DomainCloner.hpp"
#include "Virtualization/descriptor/DomainDescriptor.hpp"
#include "Virtualization/descriptor/PoolDescriptor.hpp"
#include "Virtualization/descriptor/VolumeDescriptor.hpp"
#include <map>

std::string DomainCloner::cloneVolumeName(const std::string& sourcePath, const std::string& sourceName,
                                          const std::string& cloneName) {
    const auto slash = sourcePath.find_last_of('/');
    std::string name = slash == std::string::npos ? sourcePath : sourcePath.substr(slash + 1);
    if (sourceName.empty()) return name;
    for (auto pos = name.find(sourceName); pos != std::string::npos; pos = name.find(sourceName, pos + cloneName.size())) {
        name.replace(pos, sourceName.size(), cloneName);
    }
    return name;
}

Result<CloneOutcome> DomainCloner::clone(const CloneRequest& request, const ReconcileOptions& options) {
    return guardReconcile<CloneOutcome>("Cloning domain " + request.sourceName + " to " + request.cloneName,
                                        [&] { return run(request, options); });
}

ClonedVolume DomainCloner::cloneVolume(const IStorageVolumeHandle& source, const std::string& cloneName,
                                       IStoragePoolHandle& pool, bool linked, Outcome& outcome) {
    const std::string sourceXml = source.xmlDesc();
    const std::string format = VolumeDescriptor::fromXML(sourceXml).format;
    const std::string poolPath = PoolDescriptor::fromXML(pool.xmlDesc()).targetPath;
    if (poolPath.empty()) throw StorageException("Pool " + pool.name() + " has no target path");

    const bool cow = linked && format == "qcow2";
    if (linked && !cow) {
        outcome.warn("Volume " + source.name() + " is " + format + ", making a full copy instead of a linked clone");
    }

    ClonedVolume cloned;
    std::unique_ptr<IStorageVolumeHandle> created;
    if (cow) {
        const std::string xml = cloneVolumeDescriptor(sourceXml, cloneName, poolPath, source.path());
        VRLOG_INFO("Creating linked clone {} of {} in pool {}", cloneName, source.name(), pool.name());
        created = pool.createVolume(xml, true);
    } else {
        const std::string xml = cloneVolumeDescriptor(sourceXml, cloneName, poolPath);
        VRLOG_INFO("Copying volume {} to {} in pool {}", source.name(), cloneName, pool.name());
        created = pool.createVolumeFrom(xml, source, true);
    }
    cloned.name = cloneName;
    cloned.path = created->path();
    cloned.type = cow ? "cow" : "full";
    cloned.pool = pool.name();
    return cloned;
}

std::string DomainCloner::rollback(const std::vector<ClonedVolume>& created) {
    std::string failures;
    for (const auto& volume : created) {
        try {
            auto handle = hypervisor.lookupVolumeByPath(volume.path);
            if (!handle) continue;
            VRLOG_INFO("Rolling back cloned volume {}", volume.path);
            handle->remove();
        } catch (const LibvirtException& e) {
            VRLOG_ERROR("Rollback of {} failed: {}", volume.path, e.what());
            if (!failures.empty()) failures += "; ";
            failures += volume.path + ": " + e.what();
        }
    }
    return failures;
}

CloneOutcome DomainCloner::run(const CloneRequest& request, const ReconcileOptions& options) {
    if (request.sourceName.empty() || request.cloneName.empty()) {
        throw InvalidInputException("Source and clone names are required");
    }

    auto source = hypervisor.lookupDomain(request.sourceName);
    if (!source) throw NotFoundException("Source domain " + request.sourceName + " not found");

    CloneOutcome outcome;
    outcome.cloneName = request.cloneName;
    if (auto existing = hypervisor.lookupDomain(request.cloneName)) {
        outcome.uuid = existing->uuid();
        outcome.msg = "Domain clone '" + request.cloneName + "' already exists";
        return outcome;
    }

    std::unique_ptr<IStoragePoolHandle> targetPool;
    if (!request.targetPool.empty()) {
        targetPool = hypervisor.lookupPool(request.targetPool);
        if (!targetPool) throw NotFoundException("Target storage pool " + request.targetPool + " not found");
        if (!targetPool->isActive()) {
            throw InvalidInputException("Target storage pool " + request.targetPool + " is not active");
        }
    }
    if (request.linked && targetPool) {
        throw InvalidInputException("Linked clones must be in the same storage pool as the source volume");
    }

    const std::string kind = request.linked ? "linked" : "full";
    const std::string poolSuffix = request.targetPool.empty() ? "" : " in pool " + request.targetPool;

    outcome.changed = true;
    if (options.dryRun) {
        outcome.msg = "Would create " + kind + " clone " + request.cloneName + poolSuffix;
        return outcome;
    }

    const std::string sourceXml = source->xmlDesc();
    auto descriptor = DomainDescriptor::tryParse(sourceXml);
    if (!descriptor) throw InvalidInputException("Cannot read descriptor of " + request.sourceName + ": " + descriptor.error());

    std::map<std::string, std::string> pathMap;
    std::map<std::string, std::string> volumeRefMap;
    try {
        for (const auto& disk : descriptor->disks) {
            if (disk.device != "disk") continue;
            const bool poolVolume = !disk.sourceVolume.empty();
            const std::string volumeRef = disk.sourcePool + "/" + disk.sourceVolume;
            if (poolVolume ? volumeRefMap.contains(volumeRef) : pathMap.contains(disk.sourcePath())) continue;

            std::unique_ptr<IStorageVolumeHandle> volume;
            std::unique_ptr<IStoragePoolHandle> ownPool;
            if (poolVolume) {
                ownPool = hypervisor.lookupPool(disk.sourcePool);
                if (!ownPool) throw NotFoundException("Storage pool " + disk.sourcePool + " not found");
                volume = ownPool->lookupVolume(disk.sourceVolume);
                if (!volume) throw NotFoundException("No storage volume " + volumeRef);
            } else {
                if (disk.sourcePath().empty()) continue;
                volume = hypervisor.lookupVolumeByPath(disk.sourcePath());
                if (!volume) throw NotFoundException("No storage volume for " + disk.sourcePath());
            }

            const std::string sourcePath = volume->path();
            if (auto done = pathMap.find(sourcePath); done != pathMap.end()) {
                if (poolVolume) {
                    for (const auto& cloned : outcome.storage) {
                        if (cloned.path == done->second) volumeRefMap[volumeRef] = cloned.pool + "/" + cloned.name;
                    }
                }
                continue;
            }

            IStoragePoolHandle* pool = targetPool.get();
            if (!pool) {
                if (!ownPool) ownPool = hypervisor.lookupPool(volume->poolName());
                if (!ownPool) throw NotFoundException("Storage pool of " + sourcePath + " not found");
                pool = ownPool.get();
            }

            const std::string volumeName = cloneVolumeName(poolVolume ? disk.sourceVolume : sourcePath,
                                                           request.sourceName, request.cloneName);
            auto cloned = cloneVolume(*volume, volumeName, *pool, request.linked, outcome);
            pathMap[sourcePath] = cloned.path;
            if (!disk.sourcePath().empty()) pathMap[disk.sourcePath()] = cloned.path;
            if (poolVolume) volumeRefMap[volumeRef] = cloned.pool + "/" + cloned.name;
            outcome.storage.push_back(std::move(cloned));
        }

        const std::string cloneXml = cloneDomainDescriptor(sourceXml, request.cloneName, pathMap, defaults.macPrefix,
                                                           volumeRefMap);
        VRLOG_INFO("Defining clone {}", request.cloneName);
        auto clone = hypervisor.defineDomain(cloneXml);
        outcome.uuid = clone->uuid();

        if (request.start && !clone->isActive()) {
            try {
                VRLOG_INFO("Starting clone {}", request.cloneName);
                clone->create();
            } catch (const LibvirtException& e) {
                outcome.msg = std::string("Domain cloned but failed to set power state: ") + e.what();
                outcome.warn(outcome.msg);
                return outcome;
            }
        }
    } catch (const VmException& e) {
        const std::string failures = rollback(outcome.storage);
        std::string message = std::string("Failed to clone volume: ") + e.what();
        if (!failures.empty()) {
            throw PartialFailureException(message + "; rollback incomplete: " + failures);
        }
        throw StorageException(message);
    }

    outcome.msg = "Successfully created " + kind + " clone " + request.cloneName + poolSuffix;
    return outcome;
}
