#include "Virtualization/network/VirtualNetwork.hpp"
#include "Virtualization/Utils/LibvirtError.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <cstdlib>

VirtualNetwork::VirtualNetwork(std::shared_ptr<HypervisorConnector> conn, virNetworkPtr net)
    : connector(std::move(conn)), network(net) {
    if (!network) throw VmException("VirtualNetwork: null network handle");
    const char* n = virNetworkGetName(network);
    networkName = n ? n : "";
}

VirtualNetwork::~VirtualNetwork() {
    if (network) virNetworkFree(network);
}

std::string VirtualNetwork::name() const { return networkName; }

std::string VirtualNetwork::uuid() const {
    char buf[VIR_UUID_STRING_BUFLEN];
    checkLibvirtError(virNetworkGetUUIDString(network, buf), "uuid " + networkName);
    return buf;
}

bool VirtualNetwork::isActive() const {
    const int rc = virNetworkIsActive(network);
    checkLibvirtError(rc, "isActive " + networkName);
    return rc == 1;
}

bool VirtualNetwork::isPersistent() const {
    const int rc = virNetworkIsPersistent(network);
    checkLibvirtError(rc, "isPersistent " + networkName);
    return rc == 1;
}

bool VirtualNetwork::autostart() const {
    int value = 0;
    checkLibvirtError(virNetworkGetAutostart(network, &value), "autostart " + networkName);
    return value != 0;
}

void VirtualNetwork::setAutostart(bool enabled) {
    checkLibvirtError(virNetworkSetAutostart(network, enabled ? 1 : 0), "set autostart " + networkName);
}

std::string VirtualNetwork::xmlDesc() const {
    char* xml = virNetworkGetXMLDesc(network, 0);
    if (!xml) throwLastLibvirtError("xmlDesc " + networkName);
    std::string out(xml);
    std::free(xml);
    return out;
}

void VirtualNetwork::create() { checkLibvirtError(virNetworkCreate(network), "start network " + networkName); }
void VirtualNetwork::destroy() { checkLibvirtError(virNetworkDestroy(network), "destroy network " + networkName); }
void VirtualNetwork::undefine() { checkLibvirtError(virNetworkUndefine(network), "undefine network " + networkName); }

void VirtualNetwork::updateDhcpHost(NetworkUpdateCommand command, const std::string& hostXml, bool live) {
    unsigned int cmd = VIR_NETWORK_UPDATE_COMMAND_MODIFY;
    switch (command) {
        case NetworkUpdateCommand::Modify: cmd = VIR_NETWORK_UPDATE_COMMAND_MODIFY; break;
        case NetworkUpdateCommand::AddLast: cmd = VIR_NETWORK_UPDATE_COMMAND_ADD_LAST; break;
        case NetworkUpdateCommand::Delete: cmd = VIR_NETWORK_UPDATE_COMMAND_DELETE; break;
    }
    unsigned int flags = VIR_NETWORK_UPDATE_AFFECT_CONFIG;
    if (live) flags |= VIR_NETWORK_UPDATE_AFFECT_LIVE;
    checkLibvirtError(virNetworkUpdate(network, cmd, VIR_NETWORK_SECTION_IP_DHCP_HOST, -1, hostXml.c_str(), flags),
                      "update DHCP host on " + networkName);
}
