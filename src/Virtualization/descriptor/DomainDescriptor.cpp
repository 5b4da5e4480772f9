#include "Virtualization/descriptor/DomainDescriptor.hpp"
#include "Virtualization/descriptor/XmlText.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Utils/MacAddress.hpp"
#include <algorithm>
#include <cctype>
#include <pugixml.hpp>

namespace {

// libvirt memory units to KiB
unsigned long long toKiB(unsigned long long value, std::string unit) {
    std::transform(unit.begin(), unit.end(), unit.begin(), [](unsigned char c) { return std::tolower(c); });
    if (unit.empty() || unit == "kib" || unit == "k") return value;
    if (unit == "b" || unit == "bytes") return value / 1024;
    if (unit == "kb") return value * 1000 / 1024;
    if (unit == "mib" || unit == "m") return value * 1024;
    if (unit == "mb") return value * 1000 * 1000 / 1024;
    if (unit == "gib" || unit == "g") return value * 1024 * 1024;
    if (unit == "gb") return value * 1000 * 1000 * 1000 / 1024;
    if (unit == "tib" || unit == "t") return value * 1024 * 1024 * 1024;
    return value;
}

unsigned long long memoryOf(const pugi::xml_node& node) {
    if (!node) return 0;
    return toKiB(node.text().as_ullong(0), node.attribute("unit").as_string());
}

DiskEntry parseDisk(const pugi::xml_node& disk) {
    DiskEntry entry;
    entry.type = disk.attribute("type").as_string();
    entry.device = disk.attribute("device").as_string("disk");

    if (auto source = disk.child("source")) {
        entry.sourceFile = source.attribute("file").as_string();
        entry.sourceDev = source.attribute("dev").as_string();
        entry.sourcePool = source.attribute("pool").as_string();
        entry.sourceVolume = source.attribute("volume").as_string();
    }
    if (auto target = disk.child("target")) {
        entry.targetDev = target.attribute("dev").as_string();
        entry.targetBus = target.attribute("bus").as_string();
    }
    if (auto driver = disk.child("driver")) {
        entry.driver.name = driver.attribute("name").as_string();
        entry.driver.type = driver.attribute("type").as_string();
    }
    entry.readOnly = static_cast<bool>(disk.child("readonly"));
    return entry;
}

InterfaceEntry parseInterface(const pugi::xml_node& iface) {
    InterfaceEntry entry;
    entry.type = iface.attribute("type").as_string();
    if (auto source = iface.child("source")) {
        entry.sourceNetwork = source.attribute("network").as_string();
        entry.sourceBridge = source.attribute("bridge").as_string();
    }
    entry.model = iface.child("model").attribute("type").as_string();
    entry.mac = iface.child("mac").attribute("address").as_string();
    return entry;
}

} // namespace

bool DomainDescriptor::hasController(const std::string& type) const {
    return std::find(controllerTypes.begin(), controllerTypes.end(), type) != controllerTypes.end();
}

std::expected<DomainDescriptor, std::string> DomainDescriptor::tryParse(const std::string& xml) {
    pugi::xml_document doc;
    if (auto error = loadXml(doc, xml); !error.empty()) return std::unexpected(error);

    const auto root = doc.child("domain");
    if (!root) return std::unexpected(std::string("root element is not <domain>"));

    DomainDescriptor out;
    out.name = root.child_value("name");
    out.uuid = root.child_value("uuid");
    out.vcpus = root.child("vcpu").text().as_uint(0);
    out.memory.maximumKiB = memoryOf(root.child("memory"));
    out.memory.currentKiB = memoryOf(root.child("currentMemory"));
    if (out.memory.currentKiB == 0) out.memory.currentKiB = out.memory.maximumKiB;

    const auto devices = root.child("devices");
    for (auto disk : devices.children("disk")) out.disks.push_back(parseDisk(disk));
    for (auto iface : devices.children("interface")) out.interfaces.push_back(parseInterface(iface));
    for (auto controller : devices.children("controller")) {
        out.controllerTypes.emplace_back(controller.attribute("type").as_string());
    }
    return out;
}

DomainDescriptor DomainDescriptor::fromXML(const std::string& xml) {
    return tryParse(xml).value_or(DomainDescriptor{});
}

std::string cloneDomainDescriptor(const std::string& sourceXml,
                                  const std::string& cloneName,
                                  const std::map<std::string, std::string>& volumePathMap,
                                  const std::string& macPrefix,
                                  const std::map<std::string, std::string>& volumeRefMap) {
    pugi::xml_document doc;
    if (auto error = loadXml(doc, sourceXml); !error.empty()) {
        throw InvalidInputException("Failed to prepare clone descriptor: " + error);
    }
    auto root = doc.child("domain");
    if (!root || !root.child("name")) {
        throw InvalidInputException("Failed to prepare clone descriptor: missing <domain><name>");
    }

    const std::string sourceName = root.child_value("name");
    root.child("name").text() = cloneName.c_str();

    auto uuid = root.child("uuid");
    if (!uuid) uuid = root.insert_child_after("uuid", root.child("name"));
    uuid.text() = generateUuid().c_str();

    auto devices = root.child("devices");
    for (auto iface : devices.children("interface")) {
        auto mac = iface.child("mac");
        if (!mac) continue;
        auto address = mac.attribute("address");
        if (!address) address = mac.append_attribute("address");
        address = MacAddress::generate(macPrefix).c_str();
    }

    for (auto disk : devices.children("disk")) {
        if (std::string(disk.attribute("device").as_string("disk")) != "disk") continue;
        auto source = disk.child("source");
        if (!source) continue;
        for (const char* attr : {"file", "dev"}) {
            auto pathAttr = source.attribute(attr);
            if (!pathAttr) continue;
            auto mapped = volumePathMap.find(pathAttr.as_string());
            if (mapped != volumePathMap.end()) pathAttr = mapped->second.c_str();
        }

        auto poolAttr = source.attribute("pool");
        auto volumeAttr = source.attribute("volume");
        if (!poolAttr || !volumeAttr) continue;
        auto mapped = volumeRefMap.find(std::string(poolAttr.as_string()) + "/" + volumeAttr.as_string());
        if (mapped == volumeRefMap.end()) continue;
        const auto slash = mapped->second.find('/');
        if (slash == std::string::npos) continue;
        poolAttr = mapped->second.substr(0, slash).c_str();
        volumeAttr = mapped->second.substr(slash + 1).c_str();
    }

    // per-domain firmware variables must not be shared with the source
    if (auto nvram = root.child("os").child("nvram"); nvram && !sourceName.empty()) {
        std::string path = nvram.text().as_string();
        const auto slash = path.find_last_of('/');
        const auto pos = path.find(sourceName, slash == std::string::npos ? 0 : slash + 1);
        if (pos != std::string::npos) {
            path.replace(pos, sourceName.size(), cloneName);
            nvram.text() = path.c_str();
        }
    }

    return toXmlString(doc);
}
