#pragma once
#include "Core/interfaces/IHypervisor.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include <libvirt/libvirt.h>
#include <memory>
#include <string>

// libvirt volume handle; owns the virStorageVolPtr.
class StorageVolume : public IStorageVolumeHandle {
public:
    StorageVolume(std::shared_ptr<HypervisorConnector> conn, virStorageVolPtr vol);
    ~StorageVolume() override;

    StorageVolume(const StorageVolume&) = delete;
    StorageVolume& operator=(const StorageVolume&) = delete;

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] std::string key() const override;
    [[nodiscard]] std::string path() const override;
    [[nodiscard]] VolumeRuntimeInfo info() const override;
    [[nodiscard]] std::string xmlDesc() const override;
    [[nodiscard]] std::string poolName() const override;

    void remove() override;
    void resize(std::uint64_t capacity) override;
    [[nodiscard]] std::unique_ptr<IVolumeUploadStream> upload(std::uint64_t length) override;

    [[nodiscard]] virStorageVolPtr getRawHandle() const noexcept { return volume; }

private:
    std::shared_ptr<HypervisorConnector> connector;
    virStorageVolPtr volume{nullptr};
    std::string volumeName;
};

// Upload stream bound to one volume; aborted on destruction unless finished.
class VolumeUploadStream : public IVolumeUploadStream {
public:
    VolumeUploadStream(std::shared_ptr<HypervisorConnector> conn, virStreamPtr stream, std::string volumeName);
    ~VolumeUploadStream() override;

    VolumeUploadStream(const VolumeUploadStream&) = delete;
    VolumeUploadStream& operator=(const VolumeUploadStream&) = delete;

    void send(const char* data, std::size_t length) override;
    void finish() override;
    void abort() noexcept override;

private:
    std::shared_ptr<HypervisorConnector> connector;
    virStreamPtr stream{nullptr};
    std::string volumeName;
    bool done{false};
};
