#include "API/cli/ResultJson.hpp"

using nlohmann::json;

void to_json(json& j, const DiskEntry& disk) {
    j = json{{"type", disk.type},
             {"device", disk.device},
             {"source", disk.sourcePath()},
             {"target", disk.targetDev},
             {"bus", disk.targetBus},
             {"driver", {{"name", disk.driver.name}, {"type", disk.driver.type}}}};
    if (!disk.sourcePool.empty()) {
        j["source_pool"] = disk.sourcePool;
        j["source_volume"] = disk.sourceVolume;
    }
}

void to_json(json& j, const InterfaceEntry& iface) {
    j = json{{"type", iface.type},
             {"source", iface.sourceNetwork.empty() ? iface.sourceBridge : iface.sourceNetwork},
             {"model", iface.model},
             {"mac", iface.mac}};
}

void to_json(json& j, const DomainInfo& info) {
    j = json{{"name", info.name},
             {"uuid", info.uuid},
             {"id", info.id},
             {"state", std::string(toString(info.state))},
             {"max_memory", info.maxMemoryKiB},
             {"memory", info.memoryKiB},
             {"vcpu", info.vcpus},
             {"cpu_time", info.cpuTime},
             {"active", info.active},
             {"persistent", info.persistent},
             {"autostart", info.autostart},
             {"memory_info", {{"maximum", info.memoryInfo.maximumKiB}, {"current", info.memoryInfo.currentKiB}}},
             {"disks", info.disks},
             {"interfaces", info.interfaces}};
}

void to_json(json& j, const DhcpHost& host) {
    j = json{{"mac", host.mac}, {"ip", host.ip}, {"name", host.name}};
}

void to_json(json& j, const DnsHost& host) {
    j = json{{"ip", host.ip}, {"hostnames", host.hostnames}};
}

void to_json(json& j, const NetworkInfo& info) {
    j = json{{"name", info.name},
             {"uuid", info.uuid},
             {"active", info.active},
             {"persistent", info.persistent},
             {"autostart", info.autostart},
             {"forward_mode", info.forwardMode.empty() ? std::string("isolated") : info.forwardMode},
             {"domain", info.domainName}};

    if (info.bridge) {
        j["bridge"] = {{"name", info.bridge->name}, {"stp", info.bridge->stp}, {"delay", info.bridge->delay}};
    } else {
        j["bridge"] = nullptr;
    }
    j["mtu"] = info.mtu ? json(*info.mtu) : json(nullptr);

    if (info.ip) {
        json ip{{"address", info.ip->address}, {"netmask", info.ip->netmask}, {"cidr", info.ip->cidr}};
        if (info.ip->hasDhcp) {
            ip["dhcp"] = {{"start", info.ip->dhcpStart}, {"end", info.ip->dhcpEnd}, {"hosts", info.ip->hosts}};
        } else {
            ip["dhcp"] = nullptr;
        }
        j["ip"] = std::move(ip);
    } else {
        j["ip"] = nullptr;
    }

    j["dns"] = {{"enabled", info.dns.enabled}, {"forwarders", info.dns.forwarders}, {"hosts", info.dns.hosts}};
}

void to_json(json& j, const PoolInfo& info) {
    j = json{{"name", info.name},
             {"uuid", info.uuid},
             {"state", std::string(toString(info.state))},
             {"capacity", info.capacity},
             {"allocation", info.allocation},
             {"available", info.available},
             {"active", info.active},
             {"persistent", info.persistent},
             {"autostart", info.autostart},
             {"type", info.type},
             {"target_path", info.targetPath},
             {"permissions",
              {{"mode", info.permissions.mode}, {"owner", info.permissions.owner}, {"group", info.permissions.group}}},
             {"source",
              {{"device", info.source.device},
               {"host", info.source.host},
               {"dir", info.source.dir},
               {"name", info.source.name},
               {"format", info.source.format}}}};
}

void to_json(json& j, const VolumeInfo& info) {
    j = json{{"name", info.name},
             {"pool", info.pool},
             {"path", info.path},
             {"key", info.key},
             {"format", info.format},
             {"capacity", info.capacity},
             {"allocation", info.allocation}};
    if (!info.backingPath.empty()) j["backing_store"] = info.backingPath;
}

void to_json(json& j, const ClonedVolume& volume) {
    j = json{{"name", volume.name}, {"path", volume.path}, {"type", volume.type}, {"pool", volume.pool}};
}

void to_json(json& j, const AttachedVolume& volume) {
    j = json{{"name", volume.name},
             {"type", volume.type},
             {"target", volume.target},
             {"bus", volume.bus},
             {"persistent", volume.persistent}};
}

json outcomeJson(const Outcome& outcome) {
    json j{{"changed", outcome.changed}, {"msg", outcome.msg}};
    if (!outcome.warnings.empty()) j["warnings"] = outcome.warnings;
    return j;
}

json failureJson(const std::string& message) {
    return json{{"changed", false}, {"failed", true}, {"msg", message}, {"error", message}};
}
