#pragma once
#include "Core/interfaces/IHypervisor.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include <libvirt/libvirt.h>
#include <memory>
#include <string>

// libvirt network handle; owns the virNetworkPtr.
class VirtualNetwork : public INetworkHandle {
public:
    VirtualNetwork(std::shared_ptr<HypervisorConnector> conn, virNetworkPtr net);
    ~VirtualNetwork() override;

    VirtualNetwork(const VirtualNetwork&) = delete;
    VirtualNetwork& operator=(const VirtualNetwork&) = delete;

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] std::string uuid() const override;
    [[nodiscard]] bool isActive() const override;
    [[nodiscard]] bool isPersistent() const override;
    [[nodiscard]] bool autostart() const override;
    void setAutostart(bool enabled) override;
    [[nodiscard]] std::string xmlDesc() const override;

    void create() override;
    void destroy() override;
    void undefine() override;
    void updateDhcpHost(NetworkUpdateCommand command, const std::string& hostXml, bool live) override;

private:
    std::shared_ptr<HypervisorConnector> connector;
    virNetworkPtr network{nullptr};
    std::string networkName;
};
