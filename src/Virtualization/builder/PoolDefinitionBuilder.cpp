#include "Virtualization/builder/PoolDefinitionBuilder.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <array>
#include <pugixml.hpp>

bool PoolDefinitionBuilder::isSupportedType(std::string_view type) noexcept {
    static constexpr std::array<std::string_view, 13> types{
        "dir", "fs", "netfs", "logical", "disk", "iscsi", "scsi",
        "mpath", "rbd", "sheepdog", "gluster", "zfs", "vstorage"};
    for (auto t : types) {
        if (t == type) return true;
    }
    return false;
}

std::string PoolDefinitionBuilder::build() {
    if (name.empty()) throw InvalidInputException("Pool name is required");
    if (type.empty()) throw InvalidInputException("pool_type is required when creating a new pool");
    if (!isSupportedType(type)) throw InvalidInputException("Unsupported pool type: " + type);
    if (targetPath.empty()) throw InvalidInputException("target_path is required when creating a new pool");
    return IXmlBuilderBase::build();
}

void PoolDefinitionBuilder::buildDocument() {
    auto pool = doc.append_child("pool");
    pool.append_attribute("type") = type.c_str();
    pool.append_child("name").text() = name.c_str();

    if (!source.empty()) {
        auto src = pool.append_child("source");
        if (!source.device.empty()) src.append_child("device").append_attribute("path") = source.device.c_str();
        if (!source.host.empty()) src.append_child("host").append_attribute("name") = source.host.c_str();
        if (!source.dir.empty()) src.append_child("dir").append_attribute("path") = source.dir.c_str();
        if (!source.name.empty()) src.append_child("name").text() = source.name.c_str();
        if (!source.format.empty()) src.append_child("format").append_attribute("type") = source.format.c_str();
    }

    auto target = pool.append_child("target");
    target.append_child("path").text() = targetPath.c_str();

    if (!permissions.empty()) {
        auto perms = target.append_child("permissions");
        if (!permissions.mode.empty()) perms.append_child("mode").text() = permissions.mode.c_str();
        if (!permissions.owner.empty()) perms.append_child("owner").text() = permissions.owner.c_str();
        if (!permissions.group.empty()) perms.append_child("group").text() = permissions.group.c_str();
    }
}

PoolDefinitionBuilder& PoolDefinitionBuilder::setName(std::string_view name) {
    this->name = name;
    return *this;
}

PoolDefinitionBuilder& PoolDefinitionBuilder::setType(std::string_view type) {
    this->type = type;
    return *this;
}

PoolDefinitionBuilder& PoolDefinitionBuilder::setTargetPath(std::string_view path) {
    this->targetPath = path;
    return *this;
}

PoolDefinitionBuilder& PoolDefinitionBuilder::setSource(PoolSource src) {
    this->source = std::move(src);
    return *this;
}

PoolDefinitionBuilder& PoolDefinitionBuilder::setPermissions(PermissionSpec perms) {
    this->permissions = std::move(perms);
    return *this;
}
