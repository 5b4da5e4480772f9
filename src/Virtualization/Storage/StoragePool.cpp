#include "Virtualization/Storage/StoragePool.hpp"
#include "Virtualization/Storage/StorageVolume.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <cstdlib>
#include <libvirt/virterror.h>

StoragePool::StoragePool(std::shared_ptr<HypervisorConnector> conn, virStoragePoolPtr p)
    : connector(std::move(conn)), pool(p) {
    if (!pool) throw StorageException("StoragePool: null pool handle");
    const char* n = virStoragePoolGetName(pool);
    poolName = n ? n : "";
}

StoragePool::~StoragePool() {
    if (pool) virStoragePoolFree(pool);
}

std::string StoragePool::name() const { return poolName; }

std::string StoragePool::uuid() const {
    char buf[VIR_UUID_STRING_BUFLEN];
    checkLibvirtError(virStoragePoolGetUUIDString(pool, buf), "uuid " + poolName);
    return buf;
}

PoolRuntimeInfo StoragePool::info() const {
    virStoragePoolInfo raw;
    checkLibvirtError(virStoragePoolGetInfo(pool, &raw), "info " + poolName);
    PoolRuntimeInfo out;
    out.state = static_cast<PoolState>(raw.state);
    out.capacity = raw.capacity;
    out.allocation = raw.allocation;
    out.available = raw.available;
    return out;
}

bool StoragePool::isActive() const {
    const int rc = virStoragePoolIsActive(pool);
    checkLibvirtError(rc, "isActive " + poolName);
    return rc == 1;
}

bool StoragePool::isPersistent() const {
    const int rc = virStoragePoolIsPersistent(pool);
    checkLibvirtError(rc, "isPersistent " + poolName);
    return rc == 1;
}

bool StoragePool::autostart() const {
    int value = 0;
    checkLibvirtError(virStoragePoolGetAutostart(pool, &value), "autostart " + poolName);
    return value != 0;
}

void StoragePool::setAutostart(bool enabled) {
    checkLibvirtError(virStoragePoolSetAutostart(pool, enabled ? 1 : 0), "set autostart " + poolName);
}

std::string StoragePool::xmlDesc() const {
    char* xml = virStoragePoolGetXMLDesc(pool, 0);
    if (!xml) throwLastLibvirtError("xmlDesc " + poolName);
    std::string out(xml);
    std::free(xml);
    return out;
}

void StoragePool::create() { checkLibvirtError(virStoragePoolCreate(pool, 0), "start pool " + poolName); }
void StoragePool::destroy() { checkLibvirtError(virStoragePoolDestroy(pool), "destroy pool " + poolName); }
void StoragePool::undefine() { checkLibvirtError(virStoragePoolUndefine(pool), "undefine pool " + poolName); }
void StoragePool::refresh() { checkLibvirtError(virStoragePoolRefresh(pool, 0), "refresh pool " + poolName); }

std::vector<std::string> StoragePool::listVolumes() const {
    virStorageVolPtr* vols = nullptr;
    const int count = virStoragePoolListAllVolumes(pool, &vols, 0);
    checkLibvirtError(count, "list volumes of " + poolName);

    std::vector<std::string> names;
    names.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        const char* n = virStorageVolGetName(vols[i]);
        if (n) names.emplace_back(n);
        virStorageVolFree(vols[i]);
    }
    std::free(vols);
    return names;
}

std::unique_ptr<IStorageVolumeHandle> StoragePool::lookupVolume(const std::string& name) const {
    virStorageVolPtr vol = virStorageVolLookupByName(pool, name.c_str());
    if (!vol) {
        if (lastLibvirtErrorIs(VIR_ERR_NO_STORAGE_VOL)) return nullptr;
        throwLastLibvirtError("lookup volume " + poolName + "/" + name);
    }
    return std::make_unique<StorageVolume>(connector, vol);
}

std::unique_ptr<IStorageVolumeHandle> StoragePool::createVolume(const std::string& volumeXml, bool preallocMetadata) {
    const unsigned int flags = preallocMetadata ? VIR_STORAGE_VOL_CREATE_PREALLOC_METADATA : 0;
    virStorageVolPtr vol = virStorageVolCreateXML(pool, volumeXml.c_str(), flags);
    if (!vol) throwLastLibvirtError("create volume in " + poolName);
    return std::make_unique<StorageVolume>(connector, vol);
}

std::unique_ptr<IStorageVolumeHandle>
StoragePool::createVolumeFrom(const std::string& volumeXml, const IStorageVolumeHandle& source, bool preallocMetadata) {
    virStorageVolPtr src = virStorageVolLookupByPath(virStoragePoolGetConnect(pool), source.path().c_str());
    if (!src) throwLastLibvirtError("lookup source volume " + source.name());
    StorageVolume sourceHandle(connector, src);

    const unsigned int flags = preallocMetadata ? VIR_STORAGE_VOL_CREATE_PREALLOC_METADATA : 0;
    virStorageVolPtr vol = virStorageVolCreateXMLFrom(pool, volumeXml.c_str(), sourceHandle.getRawHandle(), flags);
    if (!vol) throwLastLibvirtError("clone volume " + source.name() + " into " + poolName);
    return std::make_unique<StorageVolume>(connector, vol);
}
