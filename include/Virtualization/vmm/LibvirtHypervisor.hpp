#pragma once
#include "Core/interfaces/IHypervisor.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include <memory>

// IHypervisor over a live libvirt connection.
class LibvirtHypervisor : public IHypervisor {
public:
    explicit LibvirtHypervisor(std::shared_ptr<HypervisorConnector> connector);

    [[nodiscard]] std::string uri() const override;

    [[nodiscard]] std::vector<std::string> listDomainNames() const override;
    [[nodiscard]] std::unique_ptr<IDomainHandle> lookupDomain(const std::string& name) const override;
    [[nodiscard]] std::unique_ptr<IDomainHandle> defineDomain(const std::string& xml) override;

    [[nodiscard]] std::vector<std::string> listNetworkNames() const override;
    [[nodiscard]] std::unique_ptr<INetworkHandle> lookupNetwork(const std::string& name) const override;
    [[nodiscard]] std::unique_ptr<INetworkHandle> defineNetwork(const std::string& xml) override;

    [[nodiscard]] std::vector<std::string> listPoolNames(bool activeOnly) const override;
    [[nodiscard]] std::unique_ptr<IStoragePoolHandle> lookupPool(const std::string& name) const override;
    [[nodiscard]] std::unique_ptr<IStoragePoolHandle> definePool(const std::string& xml) override;

    [[nodiscard]] std::unique_ptr<IStorageVolumeHandle> lookupVolumeByPath(const std::string& path) const override;

private:
    std::shared_ptr<HypervisorConnector> connector;
};
