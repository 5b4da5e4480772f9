#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "System/Logger.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <cstring>
#include <libvirt/virterror.h>

std::string ConnectionParams::resolveUri(const HostDefaults& defaults) const {
    if (uri && !uri->empty()) return *uri;
    if (remoteHost && !remoteHost->empty()) return defaults.remoteUriFor(*remoteHost);
    return defaults.defaultUri;
}

HypervisorConnector::HypervisorConnector(ConnectionParams params, const HostDefaults& defaults)
    : params_(std::move(params)) {
    uri_ = params_.resolveUri(defaults);
}

HypervisorConnector::~HypervisorConnector() {
    close();
}

Result<std::shared_ptr<HypervisorConnector>>
HypervisorConnector::open(const ConnectionParams& params, const HostDefaults& defaults) {
    auto connector = std::make_shared<HypervisorConnector>(params, defaults);
    try {
        connector->connectOrThrow();
    } catch (const LibvirtException& e) {
        return Result<std::shared_ptr<HypervisorConnector>>{std::string(e.what())};
    }
    VRLOG_DEBUG("Connected to {}", connector->uri());
    return connector;
}

int HypervisorConnector::authCallback(virConnectCredentialPtr cred, unsigned int ncred, void* cbdata) {
    auto* params = static_cast<ConnectionParams*>(cbdata);
    for (unsigned int i = 0; i < ncred; ++i) {
        const std::optional<std::string>* answer = nullptr;
        if (cred[i].type == VIR_CRED_AUTHNAME) {
            answer = &params->authUser;
        } else if (cred[i].type == VIR_CRED_PASSPHRASE) {
            answer = &params->authPassword;
        } else {
            continue;
        }
        if (!answer->has_value()) return -1;

        cred[i].result = strdup((*answer)->c_str());
        if (cred[i].result == nullptr) return -1;
        cred[i].resultlen = static_cast<unsigned int>((*answer)->size());
    }
    return 0;
}

bool HypervisorConnector::connect() noexcept {
    std::scoped_lock lock(mutex_);
    if (conn) return true;

    if (params_.hasCredentials()) {
        int credTypes[] = {VIR_CRED_AUTHNAME, VIR_CRED_PASSPHRASE};
        virConnectAuth auth;
        auth.credtype = credTypes;
        auth.ncredtype = sizeof(credTypes) / sizeof(int);
        auth.cb = &HypervisorConnector::authCallback;
        auth.cbdata = &params_;
        conn = virConnectOpenAuth(uri_.c_str(), &auth, 0);
    } else {
        conn = virConnectOpen(uri_.c_str());
    }
    return conn != nullptr;
}

void HypervisorConnector::connectOrThrow() {
    if (!connect()) {
        throwLastLibvirtError("Failed to connect to " + uri_);
    }
}

void HypervisorConnector::close() noexcept {
    std::scoped_lock lock(mutex_);
    if (conn) {
        virConnectClose(conn);
        conn = nullptr;
    }
}

virConnectPtr HypervisorConnector::getRawHandle() const noexcept {
    return conn;
}

virConnectPtr HypervisorConnector::ensureConnected() {
    std::unique_lock lock(mutex_);
    if (!conn) {
        lock.unlock();
        connectOrThrow();
        lock.lock();
    }
    return conn;
}

bool HypervisorConnector::isConnected() const noexcept {
    return conn != nullptr;
}
