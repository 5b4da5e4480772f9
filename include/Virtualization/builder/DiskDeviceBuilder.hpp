#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include <string>
#include <string_view>

/**
 * @brief Builder for a pool-backed <disk> device
 *
 * Block devices (logical pools) use <source dev>, everything else
 * references the volume through <source pool volume>. CD-ROMs go on the
 * SATA bus read-only; disks on virtio.
 */
class DiskDeviceBuilder : public IXmlBuilderBase {
private:
    void buildDocument() override;

    std::string deviceType{"disk"};
    std::string targetDev;
    std::string poolName;
    std::string volumeName;
    std::string blockPath;

public:
    DiskDeviceBuilder() = default;
    ~DiskDeviceBuilder() override = default;

    // "disk" or "cdrom"
    DiskDeviceBuilder& setDeviceType(std::string_view type);
    DiskDeviceBuilder& setTargetDev(std::string_view dev);
    DiskDeviceBuilder& setVolumeSource(std::string_view pool, std::string_view volume);
    DiskDeviceBuilder& setBlockSource(std::string_view path);

    [[nodiscard]] std::string bus() const { return deviceType == "cdrom" ? "sata" : "virtio"; }
};

// <controller type='sata' index='0'> at the q35 ICH9 AHCI address.
class SataControllerBuilder : public IXmlBuilderBase {
private:
    void buildDocument() override;
};
