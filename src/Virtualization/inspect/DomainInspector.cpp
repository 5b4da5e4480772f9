#include "Virtualization/inspect/DomainInspector.hpp"
#include "Utils/Glob.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

DomainInfo DomainInspector::describe(const IDomainHandle& domain) {
    DomainInfo info;
    info.name = domain.name();
    info.uuid = domain.uuid();
    info.id = domain.id();

    const auto runtime = domain.info();
    info.state = runtime.state;
    info.maxMemoryKiB = runtime.maxMemoryKiB;
    info.memoryKiB = runtime.memoryKiB;
    info.vcpus = runtime.vcpus;
    info.cpuTime = runtime.cpuTime;

    info.active = domain.isActive();
    info.persistent = domain.isPersistent();
    info.autostart = domain.autostart();

    auto parsed = DomainDescriptor::tryParse(domain.xmlDesc());
    if (!parsed) {
        VRLOG_DEBUG("Descriptor of domain '{}' unreadable: {}", info.name, parsed.error());
        return info;
    }
    info.memoryInfo = parsed->memory;
    for (auto& disk : parsed->disks) {
        if (disk.device == "disk") info.disks.push_back(std::move(disk));
    }
    info.interfaces = std::move(parsed->interfaces);
    return info;
}

std::expected<DomainInfo, LookupFailure> DomainInspector::lookup(const std::string& name) const {
    try {
        auto domain = hypervisor.lookupDomain(name);
        if (!domain) return std::unexpected(LookupFailure::notFound());
        return describe(*domain);
    } catch (const VmException& e) {
        return std::unexpected(LookupFailure::malformed(e.what()));
    }
}

std::optional<DomainInfo> DomainInspector::getInfo(const std::string& name) const {
    return collapseLookup(lookup(name), "Domain", name);
}

std::vector<DomainInfo> DomainInspector::getByPattern(const std::string& pattern) const {
    std::vector<DomainInfo> result;
    std::vector<std::string> names;
    try {
        names = hypervisor.listDomainNames();
    } catch (const VmException& e) {
        VRLOG_DEBUG("Listing domains failed: {}", e.what());
        return result;
    }
    for (const auto& name : Glob::filter(names, pattern)) {
        if (auto info = getInfo(name)) result.push_back(std::move(*info));
    }
    return result;
}

bool DomainInspector::exists(const std::string& name) const {
    return getInfo(name).has_value();
}
