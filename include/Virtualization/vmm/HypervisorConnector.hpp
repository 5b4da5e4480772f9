#pragma once

#include "Core/config/HostDefaults.hpp"
#include "Utils/Result.hpp"
#include <libvirt/libvirt.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct ConnectionParams {
    std::optional<std::string> uri;
    std::optional<std::string> remoteHost;
    std::optional<std::string> authUser;
    std::optional<std::string> authPassword;

    // Explicit uri wins, then a remote-transport uri for remoteHost, then the local default.
    [[nodiscard]] std::string resolveUri(const HostDefaults& defaults = HostDefaults()) const;
    [[nodiscard]] bool hasCredentials() const noexcept { return authUser.has_value() || authPassword.has_value(); }
};

/**
 * @brief Owns the single libvirt connection of one invocation.
 *
 * The connection is closed on destruction; close() may also be called
 * explicitly and is idempotent.
 */
class HypervisorConnector {
public:
    HypervisorConnector() = delete;
    explicit HypervisorConnector(ConnectionParams params, const HostDefaults& defaults = HostDefaults());
    ~HypervisorConnector();

    HypervisorConnector(const HypervisorConnector&) = delete;
    HypervisorConnector& operator=(const HypervisorConnector&) = delete;

    /**
     * @brief Connects and returns the connector, or the libvirt error text.
     */
    [[nodiscard]] static Result<std::shared_ptr<HypervisorConnector>>
    open(const ConnectionParams& params, const HostDefaults& defaults = HostDefaults());

    bool connect() noexcept;
    void connectOrThrow();
    void close() noexcept;

    [[nodiscard]] virConnectPtr getRawHandle() const noexcept;
    [[nodiscard]] virConnectPtr ensureConnected();
    [[nodiscard]] bool isConnected() const noexcept;
    [[nodiscard]] const std::string& uri() const noexcept { return uri_; }

private:
    static int authCallback(virConnectCredentialPtr cred, unsigned int ncred, void* cbdata);

    mutable std::mutex mutex_;
    virConnectPtr conn{nullptr};
    ConnectionParams params_;
    std::string uri_;
};
