#pragma once
#include <string>
#include <memory>
#include <libvirt/libvirt.h>
#include "Core/interfaces/IHypervisor.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"

/**
 * @brief libvirt domain handle.
 *
 * Takes ownership of the virDomainPtr and frees it on destruction. The
 * connector is held so the connection outlives every handle opened on it.
 */
class VirtualMachine : public IDomainHandle {
public:
    VirtualMachine(std::shared_ptr<HypervisorConnector> conn, virDomainPtr dom);
    ~VirtualMachine() override;

    VirtualMachine(const VirtualMachine&) = delete;
    VirtualMachine& operator=(const VirtualMachine&) = delete;

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] std::string uuid() const override;
    [[nodiscard]] int id() const override;
    [[nodiscard]] DomainRuntimeInfo info() const override;
    [[nodiscard]] DomainState state() const override;
    [[nodiscard]] bool isActive() const override;
    [[nodiscard]] bool isPersistent() const override;
    [[nodiscard]] bool autostart() const override;
    [[nodiscard]] std::string xmlDesc() const override;

    void create() override;
    void shutdown() override;
    void destroy() override;
    void reboot() override;
    void reset() override;

    [[nodiscard]] bool hasManagedSaveImage() const override;
    void managedSaveRemove() override;
    void undefine(UndefineMode mode) override;
    void attachDevice(const std::string& deviceXml, bool live) override;

    [[nodiscard]] virDomainPtr getRawHandle() const noexcept;

private:
    std::shared_ptr<HypervisorConnector> connector;
    virDomainPtr domain{nullptr};
    std::string domainName;

    static DomainState mapLibvirtState(int state);
};
