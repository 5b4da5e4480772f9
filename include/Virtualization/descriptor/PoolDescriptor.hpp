#pragma once

#include <expected>
#include <string>

// Textual permission triple as it appears under <target><permissions>.
struct PermissionSpec {
    std::string mode;
    std::string owner;
    std::string group;

    [[nodiscard]] bool empty() const noexcept { return mode.empty() && owner.empty() && group.empty(); }
};

struct PoolSource {
    std::string device;   // <device path>
    std::string host;     // <host name>
    std::string dir;      // <dir path>
    std::string name;     // <name>, logical/rbd pools
    std::string format;   // <format type>

    [[nodiscard]] bool empty() const noexcept {
        return device.empty() && host.empty() && dir.empty() && name.empty() && format.empty();
    }
};

struct PoolDescriptor {
    std::string name;
    std::string uuid;
    std::string type;
    std::string targetPath;
    PermissionSpec permissions;
    PoolSource source;

    [[nodiscard]] static std::expected<PoolDescriptor, std::string> tryParse(const std::string& xml);
    [[nodiscard]] static PoolDescriptor fromXML(const std::string& xml);
};
