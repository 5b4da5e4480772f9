#include "Utils/Ipv4Network.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <boost/system/error_code.hpp>

namespace ip = boost::asio::ip;

namespace {

ip::address_v4 parseAddress(std::string_view text) {
    boost::system::error_code ec;
    auto address = ip::make_address_v4(std::string(text), ec);
    if (ec) throw InvalidInputException("Invalid IPv4 address: '" + std::string(text) + "'");
    return address;
}

} // namespace

Ipv4Network Ipv4Network::fromCidr(std::string_view cidr, bool strict) {
    const std::string text(cidr);
    if (text.find('/') == std::string::npos) {
        throw InvalidInputException("Invalid CIDR (missing prefix length): '" + text + "'");
    }

    ip::network_v4 parsed;
    try {
        parsed = ip::make_network_v4(text);
    } catch (const std::exception&) {
        throw InvalidInputException("Invalid CIDR: '" + text + "'");
    }

    if (strict && parsed.address() != parsed.network()) {
        throw InvalidInputException("Invalid CIDR (host bits set): '" + text + "'");
    }
    return Ipv4Network(parsed);
}

Ipv4Network Ipv4Network::fromAddressAndNetmask(std::string_view address, std::string_view netmask) {
    const auto addr = parseAddress(address);
    const auto mask = parseAddress(netmask);
    try {
        return Ipv4Network(ip::make_network_v4(addr, mask));
    } catch (const std::exception&) {
        throw InvalidInputException("Invalid netmask: '" + std::string(netmask) + "'");
    }
}

bool Ipv4Network::isValidAddress(std::string_view address) noexcept {
    boost::system::error_code ec;
    (void)ip::make_address_v4(std::string(address), ec);
    return !ec;
}

std::string Ipv4Network::networkAddress() const { return network_.network().to_string(); }
std::string Ipv4Network::broadcastAddress() const { return network_.broadcast().to_string(); }
std::string Ipv4Network::netmask() const { return network_.netmask().to_string(); }
unsigned short Ipv4Network::prefixLength() const noexcept { return network_.prefix_length(); }
std::string Ipv4Network::toString() const { return network_.to_string(); }

std::string Ipv4Network::networkOffset(std::uint32_t offset) const {
    return ip::address_v4(network_.network().to_uint() + offset).to_string();
}

std::string Ipv4Network::broadcastOffset(std::uint32_t offset) const {
    return ip::address_v4(network_.broadcast().to_uint() - offset).to_string();
}

bool Ipv4Network::contains(std::string_view address) const {
    const auto addr = parseAddress(address);
    return (addr.to_uint() & network_.netmask().to_uint()) == network_.network().to_uint();
}
