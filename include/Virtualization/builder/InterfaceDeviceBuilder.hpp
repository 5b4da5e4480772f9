#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Builder for a domain network interface device
 *
 * Constructs libvirt <interface> device XML using fluent interface pattern.
 * Without a MAC address the hypervisor assigns one on attach.
 */
class InterfaceDeviceBuilder : public IXmlBuilderBase {
private:
    void buildDocument() override;

    // NIC configuration properties
    std::string model{"virtio"};
    std::string macAddress;
    std::string networkName{"default"};
    std::string deviceType{"network"};
    std::string sourceDevice;
    std::optional<bool> linkUp;

public:
    InterfaceDeviceBuilder() = default;
    ~InterfaceDeviceBuilder() override = default;

    /**
     * @brief Sets the NIC device model
     * @param model Device model (e.g., "virtio", "e1000")
     */
    InterfaceDeviceBuilder& setModel(std::string_view model);

    /**
     * @brief Sets the MAC address for the NIC
     * @param mac MAC address in format "XX:XX:XX:XX:XX:XX"
     */
    InterfaceDeviceBuilder& setMacAddress(std::string_view mac);

    /**
     * @brief Sets the network name for the NIC
     * @param network Name of the virtual network
     */
    InterfaceDeviceBuilder& setNetworkName(std::string_view network);

    /**
     * @brief Sets the device type
     * @param type Device type ("network", "bridge", "direct")
     */
    InterfaceDeviceBuilder& setDeviceType(std::string_view type);

    /**
     * @brief Sets the source device for bridge/direct types
     */
    InterfaceDeviceBuilder& setSourceDevice(std::string_view device);

    // <link state='up|down'/>; omitted unless set
    InterfaceDeviceBuilder& setLinkState(bool up);
};
