#include "System/PermissionReconciler.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool isNumeric(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

std::optional<uid_t> PermissionReconciler::resolveOwner(const std::string& owner) {
    if (owner.empty()) return std::nullopt;
    if (isNumeric(owner)) return static_cast<uid_t>(std::stoul(owner));
    const struct passwd* entry = ::getpwnam(owner.c_str());
    if (!entry) throw InvalidInputException("Unable to resolve owner: " + owner);
    return entry->pw_uid;
}

std::optional<gid_t> PermissionReconciler::resolveGroup(const std::string& group) {
    if (group.empty()) return std::nullopt;
    if (isNumeric(group)) return static_cast<gid_t>(std::stoul(group));
    const struct group* entry = ::getgrnam(group.c_str());
    if (!entry) throw InvalidInputException("Unable to resolve group: " + group);
    return entry->gr_gid;
}

std::optional<mode_t> PermissionReconciler::parseMode(const std::string& mode) {
    if (mode.empty()) return std::nullopt;
    if (mode.size() > 4 || !std::all_of(mode.begin(), mode.end(), [](char c) { return c >= '0' && c <= '7'; })) {
        throw InvalidInputException("Invalid permission mode: " + mode);
    }
    return static_cast<mode_t>(std::stoul(mode, nullptr, 8));
}

bool PermissionReconciler::applyTo(const std::string& path, std::optional<mode_t> mode,
                                   std::optional<uid_t> uid, std::optional<gid_t> gid) const {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        throw StorageException("Failed to set permissions on " + path + ": " + std::strerror(errno));
    }

    bool changed = false;
    if (mode && (st.st_mode & 07777) != *mode) {
        VRLOG_INFO("Mode of {} {:o} -> {:o}", path, st.st_mode & 07777, *mode);
        if (!dryRun && ::chmod(path.c_str(), *mode) != 0) {
            throw StorageException("Failed to set permissions on " + path + ": " + std::strerror(errno));
        }
        changed = true;
    }

    const bool ownerDiffers = uid && *uid != st.st_uid;
    const bool groupDiffers = gid && *gid != st.st_gid;
    if (ownerDiffers || groupDiffers) {
        VRLOG_INFO("Ownership of {} {}:{} -> {}:{}", path, st.st_uid, st.st_gid,
                   uid.value_or(st.st_uid), gid.value_or(st.st_gid));
        if (!dryRun && ::chown(path.c_str(), ownerDiffers ? *uid : static_cast<uid_t>(-1),
                               groupDiffers ? *gid : static_cast<gid_t>(-1)) != 0) {
            throw StorageException("Failed to set permissions on " + path + ": " + std::strerror(errno));
        }
        changed = true;
    }
    return changed;
}

bool PermissionReconciler::manage(const std::string& path, const PermissionSpec& spec, bool recursive) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) throw NotFoundException("Path does not exist: " + path);
    if (spec.empty()) return false;

    const auto mode = parseMode(spec.mode);
    const auto uid = resolveOwner(spec.owner);
    const auto gid = resolveGroup(spec.group);

    bool changed = applyTo(path, mode, uid, gid);
    if (!recursive || !fs::is_directory(path, ec)) return changed;

    for (fs::recursive_directory_iterator it(path, ec), end; it != end; it.increment(ec)) {
        if (ec) throw StorageException("Failed to walk " + path + ": " + ec.message());
        if (applyTo(it->path().string(), mode, uid, gid)) changed = true;
    }
    if (ec) throw StorageException("Failed to walk " + path + ": " + ec.message());
    return changed;
}

bool PermissionReconciler::createWithPermissions(const std::string& path, const PermissionSpec& spec,
                                                 bool directory) const {
    std::error_code ec;
    if (fs::exists(path, ec)) return manage(path, spec);

    const auto mode = parseMode(spec.mode);
    const auto uid = resolveOwner(spec.owner);
    const auto gid = resolveGroup(spec.group);

    VRLOG_INFO("Creating {} {}", directory ? "directory" : "file", path);
    if (dryRun) return true;

    if (directory) {
        fs::create_directories(path, ec);
        if (ec) throw StorageException("Failed to create " + path + ": " + ec.message());
    } else {
        std::ofstream touch(path, std::ios::app);
        if (!touch) throw StorageException("Failed to create " + path + ": " + std::strerror(errno));
    }
    applyTo(path, mode, uid, gid);
    return true;
}
