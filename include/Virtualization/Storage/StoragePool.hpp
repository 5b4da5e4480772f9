#pragma once
#include "Core/interfaces/IHypervisor.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include <libvirt/libvirt.h>
#include <memory>
#include <string>
#include <vector>

// libvirt storage pool handle; owns the virStoragePoolPtr.
class StoragePool : public IStoragePoolHandle {
public:
    StoragePool(std::shared_ptr<HypervisorConnector> conn, virStoragePoolPtr pool);
    ~StoragePool() override;

    StoragePool(const StoragePool&) = delete;
    StoragePool& operator=(const StoragePool&) = delete;

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] std::string uuid() const override;
    [[nodiscard]] PoolRuntimeInfo info() const override;
    [[nodiscard]] bool isActive() const override;
    [[nodiscard]] bool isPersistent() const override;
    [[nodiscard]] bool autostart() const override;
    void setAutostart(bool enabled) override;
    [[nodiscard]] std::string xmlDesc() const override;

    void create() override;
    void destroy() override;
    void undefine() override;
    void refresh() override;

    [[nodiscard]] std::vector<std::string> listVolumes() const override;
    [[nodiscard]] std::unique_ptr<IStorageVolumeHandle> lookupVolume(const std::string& name) const override;
    [[nodiscard]] std::unique_ptr<IStorageVolumeHandle>
    createVolume(const std::string& volumeXml, bool preallocMetadata) override;
    [[nodiscard]] std::unique_ptr<IStorageVolumeHandle>
    createVolumeFrom(const std::string& volumeXml, const IStorageVolumeHandle& source, bool preallocMetadata) override;

private:
    std::shared_ptr<HypervisorConnector> connector;
    virStoragePoolPtr pool{nullptr};
    std::string poolName;
};
