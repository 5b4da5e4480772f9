#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include "Virtualization/descriptor/PoolDescriptor.hpp"
#include <string>
#include <string_view>

/**
 * @brief Builder for a storage pool definition
 *
 * <source> and <target><permissions> are emitted only when at least one of
 * their fields is set.
 */
class PoolDefinitionBuilder : public IXmlBuilderBase {
private:
    void buildDocument() override;

    std::string name;
    std::string type;
    std::string targetPath;
    PoolSource source;
    PermissionSpec permissions;

public:
    PoolDefinitionBuilder() = default;
    ~PoolDefinitionBuilder() override = default;

    PoolDefinitionBuilder& setName(std::string_view name);
    PoolDefinitionBuilder& setType(std::string_view type);
    PoolDefinitionBuilder& setTargetPath(std::string_view path);
    PoolDefinitionBuilder& setSource(PoolSource source);
    PoolDefinitionBuilder& setPermissions(PermissionSpec permissions);

    [[nodiscard]] static bool isSupportedType(std::string_view type) noexcept;

    /**
     * @throws InvalidInputException on missing name, type or target path, or an unknown type
     */
    [[nodiscard]] std::string build();
};
