#include "Virtualization/builder/InterfaceDeviceBuilder.hpp"
#include <pugixml.hpp>

void InterfaceDeviceBuilder::buildDocument() {
    auto interface = doc.append_child("interface");
    interface.append_attribute("type") = deviceType.c_str();

    if (!macAddress.empty()) {
        interface.append_child("mac").append_attribute("address") = macAddress.c_str();
    }

    auto source = interface.append_child("source");
    if (deviceType == "network") {
        source.append_attribute("network") = networkName.c_str();
    } else if (deviceType == "bridge") {
        source.append_attribute("bridge") = sourceDevice.c_str();
    } else if (deviceType == "direct") {
        source.append_attribute("dev") = sourceDevice.c_str();
        source.append_attribute("mode") = "passthrough";
    }

    interface.append_child("model").append_attribute("type") = model.c_str();
    if (linkUp) interface.append_child("link").append_attribute("state") = *linkUp ? "up" : "down";
}

// Fluent interface implementations
InterfaceDeviceBuilder& InterfaceDeviceBuilder::setModel(std::string_view model) {
    this->model = model;
    return *this;
}

InterfaceDeviceBuilder& InterfaceDeviceBuilder::setMacAddress(std::string_view mac) {
    this->macAddress = mac;
    return *this;
}

InterfaceDeviceBuilder& InterfaceDeviceBuilder::setNetworkName(std::string_view network) {
    this->networkName = network;
    return *this;
}

InterfaceDeviceBuilder& InterfaceDeviceBuilder::setDeviceType(std::string_view type) {
    this->deviceType = type;
    return *this;
}

InterfaceDeviceBuilder& InterfaceDeviceBuilder::setSourceDevice(std::string_view device) {
    this->sourceDevice = device;
    return *this;
}

InterfaceDeviceBuilder& InterfaceDeviceBuilder::setLinkState(bool up) {
    this->linkUp = up;
    return *this;
}
