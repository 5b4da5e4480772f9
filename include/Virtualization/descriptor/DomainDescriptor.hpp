#pragma once

#include <expected>
#include <map>
#include <string>
#include <vector>

struct DiskDriver {
    std::string name;
    std::string type;
};

struct DiskEntry {
    std::string type;          // file, block, volume, network
    std::string device;        // disk, cdrom, floppy
    std::string sourceFile;
    std::string sourceDev;
    std::string sourcePool;    // type='volume'
    std::string sourceVolume;  // type='volume'
    std::string targetDev;     // vda, sda ...
    std::string targetBus;
    DiskDriver driver;
    bool readOnly{false};

    // file or dev, whichever is set
    [[nodiscard]] const std::string& sourcePath() const noexcept {
        return sourceFile.empty() ? sourceDev : sourceFile;
    }
};

struct InterfaceEntry {
    std::string type;          // network, bridge, direct
    std::string sourceNetwork;
    std::string sourceBridge;
    std::string model;
    std::string mac;
};

struct MemoryInfo {
    unsigned long long maximumKiB{0};
    unsigned long long currentKiB{0};
};

/**
 * @brief Semantic view of a domain descriptor.
 *
 * Holds every <disk> element (cdroms included) in document order; callers
 * that only want real disks filter on device == "disk".
 */
struct DomainDescriptor {
    std::string name;
    std::string uuid;
    unsigned int vcpus{0};
    MemoryInfo memory;
    std::vector<DiskEntry> disks;
    std::vector<InterfaceEntry> interfaces;
    std::vector<std::string> controllerTypes;

    [[nodiscard]] bool hasController(const std::string& type) const;

    // Parse failure yields the reason instead of a record.
    [[nodiscard]] static std::expected<DomainDescriptor, std::string> tryParse(const std::string& xml);

    // Best effort: malformed input yields an empty descriptor.
    [[nodiscard]] static DomainDescriptor fromXML(const std::string& xml);
};

/**
 * @brief Rewrites a domain descriptor for a clone.
 *
 * Replaces name and UUID, regenerates every interface MAC under
 * @p macPrefix and remaps device='disk' source paths through
 * @p volumePathMap. Disks of type='volume' are remapped through
 * @p volumeRefMap, keyed and valued by "pool/volume". Sources missing
 * from the maps stay as they are.
 *
 * @throws InvalidInputException if @p sourceXml cannot be parsed or has no <name>
 */
[[nodiscard]] std::string cloneDomainDescriptor(const std::string& sourceXml,
                                                const std::string& cloneName,
                                                const std::map<std::string, std::string>& volumePathMap,
                                                const std::string& macPrefix = "52:54:00",
                                                const std::map<std::string, std::string>& volumeRefMap = {});
