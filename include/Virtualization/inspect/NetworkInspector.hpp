#pragma once

#include "Virtualization/inspect/ResourceInfo.hpp"
#include <expected>
#include <optional>
#include <string>
#include <vector>

class NetworkInspector {
    const IHypervisor& hypervisor;

public:
    explicit NetworkInspector(const IHypervisor& hypervisor) : hypervisor(hypervisor) {}

    [[nodiscard]] std::expected<NetworkInfo, LookupFailure> lookup(const std::string& name) const;

    [[nodiscard]] std::optional<NetworkInfo> getInfo(const std::string& name) const;
    [[nodiscard]] std::vector<NetworkInfo> getByPattern(const std::string& pattern) const;
    [[nodiscard]] bool exists(const std::string& name) const;

    /**
     * @brief First network whose derived CIDR equals @p cidr.
     *
     * Exact network address and prefix match, not containment. Host bits
     * in the query are ignored.
     *
     * @throws InvalidInputException if @p cidr is not an IPv4 CIDR
     */
    [[nodiscard]] std::optional<NetworkInfo> getByCidr(const std::string& cidr) const;

    /**
     * @brief IP reserved on @p networkName for the MAC that @p domainName
     * uses on that network. Absent when the domain, its interface on the
     * network, the network or the reservation is missing.
     */
    [[nodiscard]] std::optional<std::string> reservedIpFor(const std::string& domainName,
                                                           const std::string& networkName) const;

    [[nodiscard]] static NetworkInfo describe(const INetworkHandle& network);
};
