#include "Virtualization/descriptor/VolumeDescriptor.hpp"
#include "Virtualization/descriptor/XmlText.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <pugixml.hpp>

namespace {

std::uint64_t bytesOf(const pugi::xml_node& node) {
    if (!node) return 0;
    const std::uint64_t value = node.text().as_ullong(0);
    const std::string unit = node.attribute("unit").as_string("bytes");
    if (unit == "bytes" || unit == "B" || unit == "b") return value;
    if (unit == "KiB" || unit == "K" || unit == "k") return value * 1024ULL;
    if (unit == "MiB" || unit == "M") return value * 1024ULL * 1024;
    if (unit == "GiB" || unit == "G") return value * 1024ULL * 1024 * 1024;
    if (unit == "TiB" || unit == "T") return value * 1024ULL * 1024 * 1024 * 1024;
    if (unit == "KB") return value * 1000ULL;
    if (unit == "MB") return value * 1000ULL * 1000;
    if (unit == "GB") return value * 1000ULL * 1000 * 1000;
    if (unit == "TB") return value * 1000ULL * 1000 * 1000 * 1000;
    return value;
}

} // namespace

std::expected<VolumeDescriptor, std::string> VolumeDescriptor::tryParse(const std::string& xml) {
    pugi::xml_document doc;
    if (auto error = loadXml(doc, xml); !error.empty()) return std::unexpected(error);

    const auto root = doc.child("volume");
    if (!root) return std::unexpected(std::string("root element is not <volume>"));

    VolumeDescriptor out;
    out.name = root.child_value("name");
    out.key = root.child_value("key");
    out.capacity = bytesOf(root.child("capacity"));
    out.allocation = bytesOf(root.child("allocation"));
    if (auto target = root.child("target")) {
        out.path = target.child_value("path");
        out.format = target.child("format").attribute("type").as_string("raw");
    }
    out.backingPath = root.child("backingStore").child_value("path");
    return out;
}

VolumeDescriptor VolumeDescriptor::fromXML(const std::string& xml) {
    return tryParse(xml).value_or(VolumeDescriptor{});
}

std::string cloneVolumeDescriptor(const std::string& sourceXml,
                                  const std::string& cloneName,
                                  const std::string& poolPath,
                                  const std::optional<std::string>& backingPath) {
    pugi::xml_document doc;
    if (auto error = loadXml(doc, sourceXml); !error.empty()) {
        throw InvalidInputException("Failed to prepare volume clone descriptor: " + error);
    }
    auto root = doc.child("volume");
    if (!root) throw InvalidInputException("Failed to prepare volume clone descriptor: missing <volume>");

    auto name = root.child("name");
    if (!name) name = root.prepend_child("name");
    name.text() = cloneName.c_str();

    if (auto key = root.child("key")) key.text() = generateUuid().c_str();

    std::string base = poolPath;
    while (base.size() > 1 && base.back() == '/') base.pop_back();
    const std::string newPath = base + "/" + cloneName;

    auto target = root.child("target");
    if (!target) target = root.append_child("target");
    auto path = target.child("path");
    if (!path) path = target.prepend_child("path");
    path.text() = newPath.c_str();

    root.remove_child("backingStore");
    if (backingPath) {
        auto backing = root.append_child("backingStore");
        backing.append_child("path").text() = backingPath->c_str();
        backing.append_child("format").append_attribute("type") = "qcow2";
    }
    return toXmlString(doc);
}
