#pragma once

#include "Core/interfaces/IHypervisor.hpp"
#include "Virtualization/descriptor/DomainDescriptor.hpp"
#include "Virtualization/descriptor/NetworkDescriptor.hpp"
#include "Virtualization/descriptor/PoolDescriptor.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Why an inspector came back empty. Both kinds look the same to callers.
struct LookupFailure {
    enum class Kind { NotFound, Malformed };

    Kind kind{Kind::NotFound};
    std::string reason;

    static LookupFailure notFound() { return {Kind::NotFound, {}}; }
    static LookupFailure malformed(std::string why) { return {Kind::Malformed, std::move(why)}; }
};

struct DomainInfo {
    std::string name;
    std::string uuid;
    int id{-1};
    DomainState state{DomainState::NoState};
    unsigned long maxMemoryKiB{0};
    unsigned long memoryKiB{0};
    unsigned int vcpus{0};
    unsigned long long cpuTime{0};
    bool active{false};
    bool persistent{false};
    bool autostart{false};
    MemoryInfo memoryInfo;
    std::vector<DiskEntry> disks;         // device == "disk" only
    std::vector<InterfaceEntry> interfaces;
};

struct NetworkInfo {
    std::string name;
    std::string uuid;
    bool active{false};
    bool persistent{false};
    bool autostart{false};
    std::string forwardMode;
    std::optional<BridgeInfo> bridge;
    std::optional<unsigned int> mtu;
    std::string domainName;
    std::optional<IpInfo> ip;
    DnsInfo dns;
};

struct PoolInfo {
    std::string name;
    std::string uuid;
    PoolState state{PoolState::Inactive};
    std::uint64_t capacity{0};
    std::uint64_t allocation{0};
    std::uint64_t available{0};
    bool active{false};
    bool persistent{false};
    bool autostart{false};
    std::string type;
    std::string targetPath;
    PermissionSpec permissions;
    PoolSource source;
};

struct VolumeInfo {
    std::string name;
    std::string pool;
    std::string path;
    std::string key;
    std::string format{"raw"};
    std::uint64_t capacity{0};
    std::uint64_t allocation{0};
    std::string backingPath;
};

// Logs a failed lookup; Malformed at debug, NotFound at trace.
void reportLookupFailure(std::string_view kind, const std::string& name, const LookupFailure& failure);

template <typename Record>
[[nodiscard]] std::optional<Record> collapseLookup(std::expected<Record, LookupFailure> found,
                                                   std::string_view kind, const std::string& name) {
    if (found) return std::move(*found);
    reportLookupFailure(kind, name, found.error());
    return std::nullopt;
}
