#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <libxml/xmlwriter.h>

/**
 * @brief Writes a storage volume definition with libxml2's text writer.
 *
 * Capacity and allocation are in bytes; the file mode defaults to 0644.
 */
class VolumeDefinitionBuilder {
    std::string name;
    std::string format{"raw"};
    std::uint64_t capacity{0};
    std::uint64_t allocation{0};
    std::string mode{"0644"};

    static void check(int rc, const char* step);

public:
    VolumeDefinitionBuilder() = default;

    VolumeDefinitionBuilder& setName(std::string_view name);
    // raw, qcow2, vmdk, iso
    VolumeDefinitionBuilder& setFormat(std::string_view format);
    VolumeDefinitionBuilder& setCapacity(std::uint64_t bytes);
    VolumeDefinitionBuilder& setAllocation(std::uint64_t bytes);
    VolumeDefinitionBuilder& setMode(std::string_view mode);

    [[nodiscard]] static bool isSupportedFormat(std::string_view format) noexcept;

    /**
     * @throws InvalidInputException on a missing name or unsupported format
     * @throws VmException if libxml2 fails to write the document
     */
    [[nodiscard]] std::string build() const;
};
