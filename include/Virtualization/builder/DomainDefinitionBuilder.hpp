#pragma once

#include "Core/config/HostDefaults.hpp"
#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include <string>
#include <string_view>

/**
 * @brief Builder for a minimal bootable domain definition
 *
 * Produces a KVM domain with UEFI secure-boot firmware, a serial console,
 * SPICE graphics and a basic video device. Machine type, firmware and
 * emulator paths come from HostDefaults. A fresh UUID is generated unless
 * one is set explicitly.
 */
class DomainDefinitionBuilder : public IXmlBuilderBase {
private:
    HostDefaults defaults;
    std::string name;
    std::string uuid;
    unsigned long memoryMiB{512};
    unsigned int vcpuCount{1};

    void buildDocument() override;

    // Helper methods for building specific sections
    void buildOsSection(pugi::xml_node root);
    void buildFeaturesSection(pugi::xml_node root);
    void buildClockSection(pugi::xml_node root);
    void buildDevicesSection(pugi::xml_node root);
    void buildGraphicsSection(pugi::xml_node devices);

public:
    explicit DomainDefinitionBuilder(HostDefaults hostDefaults = HostDefaults());
    ~DomainDefinitionBuilder() override = default;

    // Builder methods with fluent interface
    DomainDefinitionBuilder& setName(std::string_view name);
    DomainDefinitionBuilder& setUuid(std::string_view uuid);
    DomainDefinitionBuilder& setMemoryMiB(unsigned long memory);
    DomainDefinitionBuilder& setCpuCount(unsigned int vcpus);

    /**
     * @throws InvalidInputException when name is empty or memory/vcpus are zero
     */
    [[nodiscard]] std::string build();
};
