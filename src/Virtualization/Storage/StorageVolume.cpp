#include "Virtualization/Storage/StorageVolume.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <cstdlib>

StorageVolume::StorageVolume(std::shared_ptr<HypervisorConnector> conn, virStorageVolPtr vol)
    : connector(std::move(conn)), volume(vol) {
    if (!volume) throw StorageException("StorageVolume: null volume handle");
    const char* n = virStorageVolGetName(volume);
    volumeName = n ? n : "";
}

StorageVolume::~StorageVolume() {
    if (volume) virStorageVolFree(volume);
}

std::string StorageVolume::name() const { return volumeName; }

std::string StorageVolume::key() const {
    const char* k = virStorageVolGetKey(volume);
    if (!k) throwLastLibvirtError("key " + volumeName);
    return k;
}

std::string StorageVolume::path() const {
    char* p = virStorageVolGetPath(volume);
    if (!p) throwLastLibvirtError("path " + volumeName);
    std::string out(p);
    std::free(p);
    return out;
}

VolumeRuntimeInfo StorageVolume::info() const {
    virStorageVolInfo raw;
    checkLibvirtError(virStorageVolGetInfo(volume, &raw), "info " + volumeName);
    VolumeRuntimeInfo out;
    out.type = raw.type;
    out.capacity = raw.capacity;
    out.allocation = raw.allocation;
    return out;
}

std::string StorageVolume::xmlDesc() const {
    char* xml = virStorageVolGetXMLDesc(volume, 0);
    if (!xml) throwLastLibvirtError("xmlDesc " + volumeName);
    std::string out(xml);
    std::free(xml);
    return out;
}

void StorageVolume::remove() {
    checkLibvirtError(virStorageVolDelete(volume, 0), "delete volume " + volumeName);
}

void StorageVolume::resize(std::uint64_t capacity) {
    checkLibvirtError(virStorageVolResize(volume, capacity, 0), "resize volume " + volumeName);
}

std::unique_ptr<IVolumeUploadStream> StorageVolume::upload(std::uint64_t length) {
    // freed during unwinding, after the error text has been captured
    std::unique_ptr<virStream, int (*)(virStreamPtr)> stream(virStreamNew(virStorageVolGetConnect(volume), 0),
                                                             virStreamFree);
    if (!stream) throwLastLibvirtError("open stream for " + volumeName);
    if (virStorageVolUpload(volume, stream.get(), 0, length, 0) < 0) throwLastLibvirtError("upload to " + volumeName);
    return std::make_unique<VolumeUploadStream>(connector, stream.release(), volumeName);
}

std::string StorageVolume::poolName() const {
    std::unique_ptr<virStoragePool, int (*)(virStoragePoolPtr)> pool(virStoragePoolLookupByVolume(volume),
                                                                     virStoragePoolFree);
    if (!pool) throwLastLibvirtError("pool of volume " + volumeName);
    const char* n = virStoragePoolGetName(pool.get());
    return n ? n : "";
}

VolumeUploadStream::VolumeUploadStream(std::shared_ptr<HypervisorConnector> conn, virStreamPtr s, std::string volName)
    : connector(std::move(conn)), stream(s), volumeName(std::move(volName)) {}

VolumeUploadStream::~VolumeUploadStream() {
    if (!done) abort();
    if (stream) virStreamFree(stream);
}

void VolumeUploadStream::send(const char* data, std::size_t length) {
    std::size_t offset = 0;
    while (offset < length) {
        const int sent = virStreamSend(stream, data + offset, length - offset);
        if (sent < 0) throwLastLibvirtError("stream to " + volumeName);
        offset += static_cast<std::size_t>(sent);
    }
}

void VolumeUploadStream::finish() {
    done = true;
    checkLibvirtError(virStreamFinish(stream), "finish stream to " + volumeName);
}

void VolumeUploadStream::abort() noexcept {
    if (done) return;
    done = true;
    virStreamAbort(stream);
}
