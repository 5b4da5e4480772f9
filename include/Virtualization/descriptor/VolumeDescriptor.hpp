#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

struct VolumeDescriptor {
    std::string name;
    std::string key;
    std::string path;
    std::string format{"raw"};
    std::uint64_t capacity{0};
    std::uint64_t allocation{0};
    std::string backingPath;

    [[nodiscard]] static std::expected<VolumeDescriptor, std::string> tryParse(const std::string& xml);
    [[nodiscard]] static VolumeDescriptor fromXML(const std::string& xml);
};

/**
 * @brief Rewrites a volume descriptor for a clone.
 *
 * Sets the name, a fresh key and <target><path> = @p poolPath/@p cloneName.
 * With @p backingPath set, a qcow2 <backingStore> pointing at it is added.
 *
 * @throws InvalidInputException if @p sourceXml cannot be parsed
 */
[[nodiscard]] std::string cloneVolumeDescriptor(const std::string& sourceXml,
                                                const std::string& cloneName,
                                                const std::string& poolPath,
                                                const std::optional<std::string>& backingPath = std::nullopt);
