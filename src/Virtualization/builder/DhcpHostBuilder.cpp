#include "Virtualization/builder/DhcpHostBuilder.hpp"
#include <pugixml.hpp>

void DhcpHostBuilder::buildDocument() {
    auto node = doc.append_child("host");
    node.append_attribute("mac") = host.mac.c_str();
    if (!host.name.empty()) node.append_attribute("name") = host.name.c_str();
    node.append_attribute("ip") = host.ip.c_str();
}
