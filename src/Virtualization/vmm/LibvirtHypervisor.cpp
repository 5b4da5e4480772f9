#include "Virtualization/vmm/LibvirtHypervisor.hpp"
#include "Virtualization/Storage/StoragePool.hpp"
#include "Virtualization/Storage/StorageVolume.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Virtualization/network/VirtualNetwork.hpp"
#include "Virtualization/vm/VirtualMachine.hpp"
#include <cstdlib>
#include <libvirt/virterror.h>

LibvirtHypervisor::LibvirtHypervisor(std::shared_ptr<HypervisorConnector> conn)
    : connector(std::move(conn)) {}

std::string LibvirtHypervisor::uri() const { return connector->uri(); }

std::vector<std::string> LibvirtHypervisor::listDomainNames() const {
    virDomainPtr* doms = nullptr;
    const int count = virConnectListAllDomains(connector->ensureConnected(), &doms, 0);
    checkLibvirtError(count, "list domains");

    std::vector<std::string> names;
    for (int i = 0; i < count; ++i) {
        const char* n = virDomainGetName(doms[i]);
        if (n) names.emplace_back(n);
        virDomainFree(doms[i]);
    }
    std::free(doms);
    return names;
}

std::unique_ptr<IDomainHandle> LibvirtHypervisor::lookupDomain(const std::string& name) const {
    virDomainPtr dom = virDomainLookupByName(connector->ensureConnected(), name.c_str());
    if (!dom) {
        if (lastLibvirtErrorIs(VIR_ERR_NO_DOMAIN)) return nullptr;
        throwLastLibvirtError("lookup domain " + name);
    }
    return std::make_unique<VirtualMachine>(connector, dom);
}

std::unique_ptr<IDomainHandle> LibvirtHypervisor::defineDomain(const std::string& xml) {
    virDomainPtr dom = virDomainDefineXML(connector->ensureConnected(), xml.c_str());
    if (!dom) throwLastLibvirtError("define domain");
    return std::make_unique<VirtualMachine>(connector, dom);
}

std::vector<std::string> LibvirtHypervisor::listNetworkNames() const {
    virNetworkPtr* nets = nullptr;
    const int count = virConnectListAllNetworks(connector->ensureConnected(), &nets, 0);
    checkLibvirtError(count, "list networks");

    std::vector<std::string> names;
    for (int i = 0; i < count; ++i) {
        const char* n = virNetworkGetName(nets[i]);
        if (n) names.emplace_back(n);
        virNetworkFree(nets[i]);
    }
    std::free(nets);
    return names;
}

std::unique_ptr<INetworkHandle> LibvirtHypervisor::lookupNetwork(const std::string& name) const {
    virNetworkPtr net = virNetworkLookupByName(connector->ensureConnected(), name.c_str());
    if (!net) {
        if (lastLibvirtErrorIs(VIR_ERR_NO_NETWORK)) return nullptr;
        throwLastLibvirtError("lookup network " + name);
    }
    return std::make_unique<VirtualNetwork>(connector, net);
}

std::unique_ptr<INetworkHandle> LibvirtHypervisor::defineNetwork(const std::string& xml) {
    virNetworkPtr net = virNetworkDefineXML(connector->ensureConnected(), xml.c_str());
    if (!net) throwLastLibvirtError("define network");
    return std::make_unique<VirtualNetwork>(connector, net);
}

std::vector<std::string> LibvirtHypervisor::listPoolNames(bool activeOnly) const {
    virStoragePoolPtr* pools = nullptr;
    const unsigned int flags = activeOnly ? VIR_CONNECT_LIST_STORAGE_POOLS_ACTIVE : 0;
    const int count = virConnectListAllStoragePools(connector->ensureConnected(), &pools, flags);
    checkLibvirtError(count, "list storage pools");

    std::vector<std::string> names;
    for (int i = 0; i < count; ++i) {
        const char* n = virStoragePoolGetName(pools[i]);
        if (n) names.emplace_back(n);
        virStoragePoolFree(pools[i]);
    }
    std::free(pools);
    return names;
}

std::unique_ptr<IStoragePoolHandle> LibvirtHypervisor::lookupPool(const std::string& name) const {
    virStoragePoolPtr pool = virStoragePoolLookupByName(connector->ensureConnected(), name.c_str());
    if (!pool) {
        if (lastLibvirtErrorIs(VIR_ERR_NO_STORAGE_POOL)) return nullptr;
        throwLastLibvirtError("lookup pool " + name);
    }
    return std::make_unique<StoragePool>(connector, pool);
}

std::unique_ptr<IStoragePoolHandle> LibvirtHypervisor::definePool(const std::string& xml) {
    virStoragePoolPtr pool = virStoragePoolDefineXML(connector->ensureConnected(), xml.c_str(), 0);
    if (!pool) throwLastLibvirtError("define pool");
    return std::make_unique<StoragePool>(connector, pool);
}

std::unique_ptr<IStorageVolumeHandle> LibvirtHypervisor::lookupVolumeByPath(const std::string& path) const {
    virStorageVolPtr vol = virStorageVolLookupByPath(connector->ensureConnected(), path.c_str());
    if (!vol) {
        if (lastLibvirtErrorIs(VIR_ERR_NO_STORAGE_VOL)) return nullptr;
        throwLastLibvirtError("lookup volume " + path);
    }
    return std::make_unique<StorageVolume>(connector, vol);
}
