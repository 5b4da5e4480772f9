#include "Virtualization/builder/DomainDefinitionBuilder.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/descriptor/XmlText.hpp"
#include <pugixml.hpp>

DomainDefinitionBuilder::DomainDefinitionBuilder(HostDefaults hostDefaults)
    : defaults(std::move(hostDefaults)) {}

std::string DomainDefinitionBuilder::build() {
    if (name.empty()) throw InvalidInputException("Domain name is required");
    if (memoryMiB == 0) throw InvalidInputException("Domain memory must be greater than zero");
    if (vcpuCount == 0) throw InvalidInputException("Domain vcpu count must be greater than zero");
    return IXmlBuilderBase::build();
}

void DomainDefinitionBuilder::buildDocument() {
    auto root = doc.append_child("domain");
    root.append_attribute("type") = "kvm";
    root.append_child("name").text() = name.c_str();
    root.append_child("uuid").text() = uuid.empty() ? generateUuid().c_str() : uuid.c_str();

    auto memory = root.append_child("memory");
    memory.append_attribute("unit") = "MiB";
    memory.text() = memoryMiB;

    auto currentMemory = root.append_child("currentMemory");
    currentMemory.append_attribute("unit") = "MiB";
    currentMemory.text() = memoryMiB;

    auto vcpu = root.append_child("vcpu");
    vcpu.append_attribute("placement") = "static";
    vcpu.text() = vcpuCount;

    buildOsSection(root);
    buildFeaturesSection(root);
    buildClockSection(root);
    buildDevicesSection(root);
}

void DomainDefinitionBuilder::buildOsSection(pugi::xml_node root) {
    auto os = root.append_child("os");
    auto type = os.append_child("type");
    type.append_attribute("arch") = defaults.arch.c_str();
    type.append_attribute("machine") = defaults.machineType.c_str();
    type.text() = "hvm";

    auto loader = os.append_child("loader");
    loader.append_attribute("readonly") = "yes";
    loader.append_attribute("type") = "pflash";
    loader.append_attribute("secure") = "yes";
    loader.text() = defaults.loaderPath.c_str();

    os.append_child("nvram").text() = defaults.nvramPathFor(name).c_str();
}

void DomainDefinitionBuilder::buildFeaturesSection(pugi::xml_node root) {
    auto features = root.append_child("features");
    features.append_child("acpi");
    features.append_child("apic");
    // secure boot needs SMM
    features.append_child("smm").append_attribute("state") = "on";
}

void DomainDefinitionBuilder::buildClockSection(pugi::xml_node root) {
    auto clock = root.append_child("clock");
    clock.append_attribute("offset") = "utc";

    auto rtc = clock.append_child("timer");
    rtc.append_attribute("name") = "rtc";
    rtc.append_attribute("tickpolicy") = "catchup";

    auto pit = clock.append_child("timer");
    pit.append_attribute("name") = "pit";
    pit.append_attribute("tickpolicy") = "delay";

    auto hpet = clock.append_child("timer");
    hpet.append_attribute("name") = "hpet";
    hpet.append_attribute("present") = "no";
}

void DomainDefinitionBuilder::buildDevicesSection(pugi::xml_node root) {
    auto devices = root.append_child("devices");
    devices.append_child("emulator").text() = defaults.emulator.c_str();

    auto console = devices.append_child("console");
    console.append_attribute("type") = "pty";
    auto target = console.append_child("target");
    target.append_attribute("type") = "serial";
    target.append_attribute("port") = "0";

    buildGraphicsSection(devices);

    auto video = devices.append_child("video");
    auto model = video.append_child("model");
    model.append_attribute("type") = "cirrus";
    model.append_attribute("vram") = "16384";
    model.append_attribute("heads") = "1";
    model.append_attribute("primary") = "yes";
    auto address = video.append_child("address");
    address.append_attribute("type") = "pci";
    address.append_attribute("domain") = "0x0000";
    address.append_attribute("bus") = "0x07";
    address.append_attribute("slot") = "0x01";
    address.append_attribute("function") = "0x0";
}

void DomainDefinitionBuilder::buildGraphicsSection(pugi::xml_node devices) {
    auto graphics = devices.append_child("graphics");
    graphics.append_attribute("type") = "spice";
    graphics.append_attribute("autoport") = "yes";

    graphics.append_child("listen").append_attribute("type") = "address";
    graphics.append_child("image").append_attribute("compression") = "off";
    graphics.append_child("gl").append_attribute("enable") = "no";
}

// Fluent interface implementations
DomainDefinitionBuilder& DomainDefinitionBuilder::setName(std::string_view name) {
    this->name = name;
    return *this;
}

DomainDefinitionBuilder& DomainDefinitionBuilder::setUuid(std::string_view uuid) {
    this->uuid = uuid;
    return *this;
}

DomainDefinitionBuilder& DomainDefinitionBuilder::setMemoryMiB(unsigned long memory) {
    this->memoryMiB = memory;
    return *this;
}

DomainDefinitionBuilder& DomainDefinitionBuilder::setCpuCount(unsigned int vcpus) {
    this->vcpuCount = vcpus;
    return *this;
}
