#pragma once
#include <nlohmann/json.hpp>
#include "Virtualization/inspect/ResourceInfo.hpp"
#include "Virtualization/operations/DomainCloner.hpp"
#include "Virtualization/operations/VolumeAttacher.hpp"
#include "Virtualization/reconcile/ReconcileTypes.hpp"

// nlohmann::json conversions for the records printed by the command line.
// Keys follow the snake_case names of the result contract.

void to_json(nlohmann::json& j, const DiskEntry& disk);
void to_json(nlohmann::json& j, const InterfaceEntry& iface);
void to_json(nlohmann::json& j, const DomainInfo& info);

void to_json(nlohmann::json& j, const DhcpHost& host);
void to_json(nlohmann::json& j, const DnsHost& host);
void to_json(nlohmann::json& j, const NetworkInfo& info);

void to_json(nlohmann::json& j, const PoolInfo& info);
void to_json(nlohmann::json& j, const VolumeInfo& info);

void to_json(nlohmann::json& j, const ClonedVolume& volume);
void to_json(nlohmann::json& j, const AttachedVolume& volume);

/**
 * @brief changed, msg and warnings of any reconciliation outcome.
 */
[[nodiscard]] nlohmann::json outcomeJson(const Outcome& outcome);

// {"changed": false, "failed": true, "msg": ..., "error": ...}
[[nodiscard]] nlohmann::json failureJson(const std::string& message);

// JSON null for an empty optional
template <typename T>
[[nodiscard]] nlohmann::json optionalJson(const std::optional<T>& value) {
    if (!value) return nullptr;
    return nlohmann::json(*value);
}
