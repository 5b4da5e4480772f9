#include "Virtualization/operations/VolumeAttacher.hpp"
#include "Virtualization/builder/DiskDeviceBuilder.hpp"
#include "Virtualization/descriptor/PoolDescriptor.hpp"
#include "Virtualization/descriptor/XmlText.hpp"
#include <algorithm>
#include <cctype>
#include <pugixml.hpp>
#include <set>

namespace {

std::string baseName(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool endsWithIso(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
    return name.size() >= 4 && name.compare(name.size() - 4, 4, ".iso") == 0;
}

bool isAttached(const DomainDescriptor& domain, const std::string& pool, const std::string& volume,
                const std::string& volumePath) {
    for (const auto& disk : domain.disks) {
        if (!disk.sourcePool.empty() && disk.sourcePool == pool && disk.sourceVolume == volume) return true;
        const auto& source = disk.sourcePath();
        if (source.empty()) continue;
        if (source == volumePath || baseName(source) == volume) return true;
    }
    return false;
}

DomainDescriptor readDomain(const IDomainHandle& domain) {
    auto parsed = DomainDescriptor::tryParse(domain.xmlDesc());
    if (!parsed) throw LibvirtException("Cannot read descriptor of domain " + domain.name() + ": " + parsed.error());
    return std::move(*parsed);
}

} // namespace

bool VolumeAttacher::isIsoVolume(const IStorageVolumeHandle& volume) {
    pugi::xml_document doc;
    try {
        if (!loadXml(doc, volume.xmlDesc()).empty()) return endsWithIso(volume.name());
    } catch (const LibvirtException& e) {
        VRLOG_DEBUG("Cannot read descriptor of volume {}: {}", volume.name(), e.what());
        return false;
    }
    auto format = doc.child("volume").child("target").child("format");
    if (format) return std::string_view(format.attribute("type").as_string()) == "iso";
    return endsWithIso(volume.name());
}

std::string VolumeAttacher::nextTargetDev(const DomainDescriptor& domain, const std::string& prefix) {
    std::set<std::string> taken;
    for (const auto& disk : domain.disks) {
        if (disk.targetDev.rfind(prefix, 0) == 0) taken.insert(disk.targetDev);
    }
    for (char letter = 'a'; letter <= 'z'; ++letter) {
        std::string candidate = prefix + letter;
        if (!taken.contains(candidate)) return candidate;
    }
    throw StorageException("No free target device name with prefix " + prefix);
}

Result<VolumeAttachOutcome> VolumeAttacher::attach(const VolumeAttachRequest& request, const ReconcileOptions& options) {
    return guardReconcile<VolumeAttachOutcome>("Attaching volumes to " + request.domainName,
                                               [&] { return run(request, options); });
}

VolumeAttachOutcome VolumeAttacher::run(const VolumeAttachRequest& request, const ReconcileOptions& options) {
    if (request.volumes.empty()) throw InvalidInputException("At least one volume is required");

    auto domain = hypervisor.lookupDomain(request.domainName);
    if (!domain) throw NotFoundException("Domain " + request.domainName + " not found");
    auto pool = hypervisor.lookupPool(request.poolName);
    if (!pool) throw NotFoundException("Storage pool " + request.poolName + " not found");

    VolumeAttachOutcome outcome;
    try {
        pool->refresh();
    } catch (const LibvirtException& e) {
        outcome.warn("Failed to refresh pool " + request.poolName + ": " + e.what());
    }

    const bool running = domain->state() == DomainState::Running;
    outcome.domainState = running ? "running" : "shutoff";
    const std::string poolType = PoolDescriptor::fromXML(pool->xmlDesc()).type;

    std::vector<DiskEntry> planned;  // dry-run only; nothing is attached to re-read
    for (const auto& volumeName : request.volumes) {
        auto volume = pool->lookupVolume(volumeName);
        if (!volume) throw NotFoundException("Volume " + volumeName + " not found in pool " + request.poolName);

        DomainDescriptor current = readDomain(*domain);
        current.disks.insert(current.disks.end(), planned.begin(), planned.end());
        const std::string volumePath = volume->path();
        if (isAttached(current, request.poolName, volumeName, volumePath)) {
            VRLOG_INFO("Volume {} already attached to {}", volumeName, request.domainName);
            outcome.alreadyAttached.push_back(volumeName);
            continue;
        }

        const bool iso = isIsoVolume(*volume);
        const std::string deviceType = iso ? "cdrom" : "disk";
        const std::string target = nextTargetDev(current, iso ? "sd" : "vd");

        DiskDeviceBuilder builder;
        builder.setDeviceType(deviceType).setTargetDev(target);
        if (poolType == "logical") {
            builder.setBlockSource(volumePath);
        } else {
            builder.setVolumeSource(request.poolName, volumeName);
        }

        outcome.changed = true;
        outcome.attachedVolumes.push_back({volumeName, deviceType, target, builder.bus(), true});
        if (options.dryRun) {
            DiskEntry entry;
            entry.device = deviceType;
            entry.targetDev = target;
            entry.sourcePool = request.poolName;
            entry.sourceVolume = volumeName;
            planned.push_back(std::move(entry));
            continue;
        }

        if (iso && !current.hasController("sata")) {
            VRLOG_INFO("Adding SATA controller to {}", request.domainName);
            SataControllerBuilder controller;
            domain->attachDevice(controller.build(), running);
        }
        VRLOG_INFO("Attaching {} {} to {} as {}", deviceType, volumeName, request.domainName, target);
        domain->attachDevice(builder.build(), running);
    }

    const auto count = outcome.attachedVolumes.size();
    if (count == 0) {
        outcome.msg = "No volumes were attached";
    } else {
        outcome.msg = std::string(options.dryRun ? "Would attach " : "Successfully attached ") + std::to_string(count) +
                      " volume(s) to " + outcome.domainState + " domain";
    }
    return outcome;
}
