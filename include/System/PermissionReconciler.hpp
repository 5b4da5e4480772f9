#pragma once
#include "Virtualization/descriptor/PoolDescriptor.hpp"
#include <optional>
#include <string>
#include <sys/types.h>

/**
 * @brief Converges mode, owner and group of pool directories and volume files.
 *
 * Only the fields that differ are touched. Empty fields in a PermissionSpec
 * are left alone. With dryRun set nothing on disk is modified but the
 * return values still say whether a change would happen.
 */
class PermissionReconciler {
    bool dryRun;

    bool applyTo(const std::string& path, std::optional<mode_t> mode,
                 std::optional<uid_t> uid, std::optional<gid_t> gid) const;

public:
    explicit PermissionReconciler(bool dryRun = false) : dryRun(dryRun) {}

    // Numeric ids pass through. Throws InvalidInputException when a name cannot be resolved.
    [[nodiscard]] static std::optional<uid_t> resolveOwner(const std::string& owner);
    [[nodiscard]] static std::optional<gid_t> resolveGroup(const std::string& group);

    // Octal text such as "0755". Throws InvalidInputException.
    [[nodiscard]] static std::optional<mode_t> parseMode(const std::string& mode);

    /**
     * @brief Applies @p spec to an existing path.
     * @param recursive also every entry below a directory
     * @return whether anything changed (or would change)
     * @throws NotFoundException if @p path does not exist
     * @throws StorageException on stat/chmod/chown failures
     */
    bool manage(const std::string& path, const PermissionSpec& spec, bool recursive = false) const;

    /**
     * @brief Creates a directory (with parents) or an empty file, then applies @p spec
     * to the path itself. An existing path is only converged.
     */
    bool createWithPermissions(const std::string& path, const PermissionSpec& spec, bool directory) const;
};
