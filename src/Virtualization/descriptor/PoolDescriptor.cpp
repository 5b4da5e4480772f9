#include "Virtualization/descriptor/PoolDescriptor.hpp"
#include "Virtualization/descriptor/XmlText.hpp"
#include <pugixml.hpp>

std::expected<PoolDescriptor, std::string> PoolDescriptor::tryParse(const std::string& xml) {
    pugi::xml_document doc;
    if (auto error = loadXml(doc, xml); !error.empty()) return std::unexpected(error);

    const auto root = doc.child("pool");
    if (!root) return std::unexpected(std::string("root element is not <pool>"));

    PoolDescriptor out;
    out.name = root.child_value("name");
    out.uuid = root.child_value("uuid");
    out.type = root.attribute("type").as_string();

    if (auto target = root.child("target")) {
        out.targetPath = target.child_value("path");
        if (auto perms = target.child("permissions")) {
            out.permissions.mode = perms.child_value("mode");
            out.permissions.owner = perms.child_value("owner");
            out.permissions.group = perms.child_value("group");
        }
    }

    if (auto source = root.child("source")) {
        out.source.device = source.child("device").attribute("path").as_string();
        out.source.host = source.child("host").attribute("name").as_string();
        out.source.dir = source.child("dir").attribute("path").as_string();
        out.source.name = source.child_value("name");
        out.source.format = source.child("format").attribute("type").as_string();
    }
    return out;
}

PoolDescriptor PoolDescriptor::fromXML(const std::string& xml) {
    return tryParse(xml).value_or(PoolDescriptor{});
}
