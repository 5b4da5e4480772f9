#include "Virtualization/inspect/PoolInspector.hpp"
#include "Utils/Glob.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

PoolInfo PoolInspector::describe(const IStoragePoolHandle& pool) {
    PoolInfo info;
    info.name = pool.name();
    info.uuid = pool.uuid();

    const auto runtime = pool.info();
    info.state = runtime.state;
    info.capacity = runtime.capacity;
    info.allocation = runtime.allocation;
    info.available = runtime.available;

    info.active = pool.isActive();
    info.persistent = pool.isPersistent();
    info.autostart = pool.autostart();

    auto parsed = PoolDescriptor::tryParse(pool.xmlDesc());
    if (!parsed) {
        VRLOG_DEBUG("Descriptor of pool '{}' unreadable: {}", info.name, parsed.error());
        return info;
    }
    info.type = std::move(parsed->type);
    info.targetPath = std::move(parsed->targetPath);
    info.permissions = std::move(parsed->permissions);
    info.source = std::move(parsed->source);
    return info;
}

std::expected<PoolInfo, LookupFailure> PoolInspector::lookup(const std::string& name) const {
    try {
        auto pool = hypervisor.lookupPool(name);
        if (!pool) return std::unexpected(LookupFailure::notFound());
        return describe(*pool);
    } catch (const VmException& e) {
        return std::unexpected(LookupFailure::malformed(e.what()));
    }
}

std::optional<PoolInfo> PoolInspector::getInfo(const std::string& name) const {
    return collapseLookup(lookup(name), "Pool", name);
}

std::vector<PoolInfo> PoolInspector::getByPattern(const std::string& pattern) const {
    std::vector<PoolInfo> result;
    std::vector<std::string> names;
    try {
        names = hypervisor.listPoolNames();
    } catch (const VmException& e) {
        VRLOG_DEBUG("Listing pools failed: {}", e.what());
        return result;
    }
    for (const auto& name : Glob::filter(names, pattern)) {
        if (auto info = getInfo(name)) result.push_back(std::move(*info));
    }
    return result;
}

bool PoolInspector::exists(const std::string& name) const {
    return getInfo(name).has_value();
}
