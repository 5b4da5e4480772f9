#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include "Virtualization/descriptor/NetworkDescriptor.hpp"

// Single <host mac ip name/> element for a targeted DHCP section update.
class DhcpHostBuilder : public IXmlBuilderBase {
private:
    void buildDocument() override;
    DhcpHost host;

public:
    explicit DhcpHostBuilder(DhcpHost entry) : host(std::move(entry)) {}
};
