#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Values match virDomainState.
enum class DomainState {
    NoState = 0,
    Running = 1,
    Blocked = 2,
    Paused = 3,
    Shutdown = 4,
    Shutoff = 5,
    Crashed = 6,
    PmSuspended = 7
};

// Values match virStoragePoolState.
enum class PoolState {
    Inactive = 0,
    Building = 1,
    Running = 2,
    Degraded = 3,
    Inaccessible = 4
};

[[nodiscard]] std::string_view toString(DomainState state) noexcept;
[[nodiscard]] std::string_view toString(PoolState state) noexcept;

enum class UndefineMode {
    Basic,     ///< plain undefine
    Extended   ///< also drops managed save, snapshot and checkpoint metadata and NVRAM
};

enum class NetworkUpdateCommand { Modify, AddLast, Delete };

struct DomainRuntimeInfo {
    DomainState state{DomainState::NoState};
    unsigned long maxMemoryKiB{0};
    unsigned long memoryKiB{0};
    unsigned int vcpus{0};
    unsigned long long cpuTime{0};
};

struct PoolRuntimeInfo {
    PoolState state{PoolState::Inactive};
    std::uint64_t capacity{0};
    std::uint64_t allocation{0};
    std::uint64_t available{0};
};

struct VolumeRuntimeInfo {
    int type{0};
    std::uint64_t capacity{0};
    std::uint64_t allocation{0};
};

/**
 * @brief Streams bytes into a volume opened with IStorageVolumeHandle::upload.
 *
 * Either finish() or abort() ends the transfer. Destroying an unfinished
 * stream aborts it.
 */
class IVolumeUploadStream {
public:
    virtual ~IVolumeUploadStream() = default;
    virtual void send(const char* data, std::size_t length) = 0;
    virtual void finish() = 0;
    virtual void abort() noexcept = 0;
};

class IDomainHandle {
public:
    virtual ~IDomainHandle() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::string uuid() const = 0;
    [[nodiscard]] virtual int id() const = 0;  ///< -1 when not running
    [[nodiscard]] virtual DomainRuntimeInfo info() const = 0;
    [[nodiscard]] virtual DomainState state() const = 0;
    [[nodiscard]] virtual bool isActive() const = 0;
    [[nodiscard]] virtual bool isPersistent() const = 0;
    [[nodiscard]] virtual bool autostart() const = 0;
    [[nodiscard]] virtual std::string xmlDesc() const = 0;

    virtual void create() = 0;
    virtual void shutdown() = 0;
    virtual void destroy() = 0;
    virtual void reboot() = 0;
    virtual void reset() = 0;

    [[nodiscard]] virtual bool hasManagedSaveImage() const = 0;
    virtual void managedSaveRemove() = 0;
    virtual void undefine(UndefineMode mode) = 0;

    /**
     * @brief Attaches a device described by @p deviceXml.
     * @param live also apply to the running instance; the persistent
     *        definition is always updated
     */
    virtual void attachDevice(const std::string& deviceXml, bool live) = 0;
};

class INetworkHandle {
public:
    virtual ~INetworkHandle() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::string uuid() const = 0;
    [[nodiscard]] virtual bool isActive() const = 0;
    [[nodiscard]] virtual bool isPersistent() const = 0;
    [[nodiscard]] virtual bool autostart() const = 0;
    virtual void setAutostart(bool enabled) = 0;
    [[nodiscard]] virtual std::string xmlDesc() const = 0;

    virtual void create() = 0;
    virtual void destroy() = 0;
    virtual void undefine() = 0;

    // Targeted update of one <ip><dhcp><host> entry; config always, live when requested.
    virtual void updateDhcpHost(NetworkUpdateCommand command, const std::string& hostXml, bool live) = 0;
};

class IStorageVolumeHandle {
public:
    virtual ~IStorageVolumeHandle() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::string key() const = 0;
    [[nodiscard]] virtual std::string path() const = 0;
    [[nodiscard]] virtual VolumeRuntimeInfo info() const = 0;
    [[nodiscard]] virtual std::string xmlDesc() const = 0;
    [[nodiscard]] virtual std::string poolName() const = 0;  ///< pool holding this volume

    virtual void remove() = 0;
    virtual void resize(std::uint64_t capacity) = 0;
    [[nodiscard]] virtual std::unique_ptr<IVolumeUploadStream> upload(std::uint64_t length) = 0;
};

class IStoragePoolHandle {
public:
    virtual ~IStoragePoolHandle() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::string uuid() const = 0;
    [[nodiscard]] virtual PoolRuntimeInfo info() const = 0;
    [[nodiscard]] virtual bool isActive() const = 0;
    [[nodiscard]] virtual bool isPersistent() const = 0;
    [[nodiscard]] virtual bool autostart() const = 0;
    virtual void setAutostart(bool enabled) = 0;
    [[nodiscard]] virtual std::string xmlDesc() const = 0;

    virtual void create() = 0;
    virtual void destroy() = 0;
    virtual void undefine() = 0;
    virtual void refresh() = 0;

    [[nodiscard]] virtual std::vector<std::string> listVolumes() const = 0;
    [[nodiscard]] virtual std::unique_ptr<IStorageVolumeHandle> lookupVolume(const std::string& name) const = 0;

    [[nodiscard]] virtual std::unique_ptr<IStorageVolumeHandle>
    createVolume(const std::string& volumeXml, bool preallocMetadata) = 0;

    // Full copy of @p source into a new volume described by @p volumeXml.
    [[nodiscard]] virtual std::unique_ptr<IStorageVolumeHandle>
    createVolumeFrom(const std::string& volumeXml, const IStorageVolumeHandle& source, bool preallocMetadata) = 0;
};

/**
 * @brief One open hypervisor session.
 *
 * Lookups return nullptr when the object does not exist and throw
 * LibvirtException for any other failure.
 */
class IHypervisor {
public:
    virtual ~IHypervisor() = default;

    [[nodiscard]] virtual std::string uri() const = 0;

    // Running domains plus defined ones.
    [[nodiscard]] virtual std::vector<std::string> listDomainNames() const = 0;
    [[nodiscard]] virtual std::unique_ptr<IDomainHandle> lookupDomain(const std::string& name) const = 0;
    [[nodiscard]] virtual std::unique_ptr<IDomainHandle> defineDomain(const std::string& xml) = 0;

    // Active networks plus defined ones.
    [[nodiscard]] virtual std::vector<std::string> listNetworkNames() const = 0;
    [[nodiscard]] virtual std::unique_ptr<INetworkHandle> lookupNetwork(const std::string& name) const = 0;
    [[nodiscard]] virtual std::unique_ptr<INetworkHandle> defineNetwork(const std::string& xml) = 0;

    [[nodiscard]] virtual std::vector<std::string> listPoolNames(bool activeOnly = false) const = 0;
    [[nodiscard]] virtual std::unique_ptr<IStoragePoolHandle> lookupPool(const std::string& name) const = 0;
    [[nodiscard]] virtual std::unique_ptr<IStoragePoolHandle> definePool(const std::string& xml) = 0;

    [[nodiscard]] virtual std::unique_ptr<IStorageVolumeHandle> lookupVolumeByPath(const std::string& path) const = 0;
};
