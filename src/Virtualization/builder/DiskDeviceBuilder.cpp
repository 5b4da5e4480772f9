#include "Virtualization/builder/DiskDeviceBuilder.hpp"
#include <pugixml.hpp>

void DiskDeviceBuilder::buildDocument() {
    auto disk = doc.append_child("disk");
    disk.append_attribute("type") = blockPath.empty() ? "volume" : "block";
    disk.append_attribute("device") = deviceType.c_str();

    auto driver = disk.append_child("driver");
    driver.append_attribute("name") = "qemu";
    driver.append_attribute("type") = "raw";

    auto source = disk.append_child("source");
    if (!blockPath.empty()) {
        source.append_attribute("dev") = blockPath.c_str();
    } else {
        source.append_attribute("volume") = volumeName.c_str();
        source.append_attribute("pool") = poolName.c_str();
    }

    auto target = disk.append_child("target");
    target.append_attribute("dev") = targetDev.c_str();
    target.append_attribute("bus") = bus().c_str();

    if (deviceType == "cdrom") disk.append_child("readonly");
}

DiskDeviceBuilder& DiskDeviceBuilder::setDeviceType(std::string_view type) {
    this->deviceType = type;
    return *this;
}

DiskDeviceBuilder& DiskDeviceBuilder::setTargetDev(std::string_view dev) {
    this->targetDev = dev;
    return *this;
}

DiskDeviceBuilder& DiskDeviceBuilder::setVolumeSource(std::string_view pool, std::string_view volume) {
    this->poolName = pool;
    this->volumeName = volume;
    this->blockPath.clear();
    return *this;
}

DiskDeviceBuilder& DiskDeviceBuilder::setBlockSource(std::string_view path) {
    this->blockPath = path;
    return *this;
}

void SataControllerBuilder::buildDocument() {
    auto controller = doc.append_child("controller");
    controller.append_attribute("type") = "sata";
    controller.append_attribute("index") = "0";

    auto address = controller.append_child("address");
    address.append_attribute("type") = "pci";
    address.append_attribute("domain") = "0x0000";
    address.append_attribute("bus") = "0x00";
    address.append_attribute("slot") = "0x1f";
    address.append_attribute("function") = "0x2";
}
