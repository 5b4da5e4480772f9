#include "Virtualization/inspect/VolumeInspector.hpp"
#include "Utils/Glob.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/descriptor/VolumeDescriptor.hpp"

std::pair<std::string, std::string> VolumeInspector::parseVolumeKey(const std::string& key) {
    const auto slash = key.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == key.size()) {
        throw InvalidInputException("Volume path must be in format 'pool_name/volume_name', got '" + key + "'");
    }
    return {key.substr(0, slash), key.substr(slash + 1)};
}

VolumeInfo VolumeInspector::describe(const IStorageVolumeHandle& volume, const std::string& poolName) {
    VolumeInfo info;
    info.name = volume.name();
    info.pool = poolName;
    info.path = volume.path();
    info.key = volume.key();

    const auto runtime = volume.info();
    info.capacity = runtime.capacity;
    info.allocation = runtime.allocation;

    auto parsed = VolumeDescriptor::tryParse(volume.xmlDesc());
    if (!parsed) {
        VRLOG_DEBUG("Descriptor of volume '{}/{}' unreadable: {}", poolName, info.name, parsed.error());
        return info;
    }
    info.format = parsed->format;
    info.backingPath = parsed->backingPath;
    return info;
}

std::unique_ptr<IStoragePoolHandle> VolumeInspector::refreshedPool(const std::string& poolName) const {
    auto pool = hypervisor.lookupPool(poolName);
    if (!pool) return nullptr;
    try {
        pool->refresh();
    } catch (const LibvirtException& e) {
        VRLOG_DEBUG("Refreshing pool '{}' failed: {}", poolName, e.what());
    }
    return pool;
}

std::expected<VolumeInfo, LookupFailure> VolumeInspector::lookup(const std::string& poolName,
                                                                 const std::string& volumeName) const {
    try {
        auto pool = refreshedPool(poolName);
        if (!pool) return std::unexpected(LookupFailure::notFound());
        auto volume = pool->lookupVolume(volumeName);
        if (!volume) return std::unexpected(LookupFailure::notFound());
        return describe(*volume, poolName);
    } catch (const VmException& e) {
        return std::unexpected(LookupFailure::malformed(e.what()));
    }
}

std::optional<VolumeInfo> VolumeInspector::getInfo(const std::string& poolName, const std::string& volumeName) const {
    return collapseLookup(lookup(poolName, volumeName), "Volume", poolName + "/" + volumeName);
}

std::optional<VolumeInfo> VolumeInspector::getInfo(const std::string& key) const {
    const auto [poolName, volumeName] = parseVolumeKey(key);
    return getInfo(poolName, volumeName);
}

std::vector<VolumeInfo> VolumeInspector::getByPattern(const std::string& key) const {
    const auto [poolName, pattern] = parseVolumeKey(key);
    return getByPattern(poolName, pattern);
}

std::vector<VolumeInfo> VolumeInspector::getByPattern(const std::string& poolName, const std::string& pattern) const {
    std::vector<VolumeInfo> result;
    try {
        auto pool = refreshedPool(poolName);
        if (!pool) return result;
        for (const auto& name : Glob::filter(pool->listVolumes(), pattern)) {
            auto volume = pool->lookupVolume(name);
            if (!volume) continue;
            result.push_back(describe(*volume, poolName));
        }
    } catch (const VmException& e) {
        VRLOG_DEBUG("Listing volumes of pool '{}' failed: {}", poolName, e.what());
    }
    return result;
}

bool VolumeInspector::exists(const std::string& poolName, const std::string& volumeName) const {
    return getInfo(poolName, volumeName).has_value();
}
