#pragma once
#include <boost/asio/ip/network_v4.hpp>
#include <cstdint>
#include <string>
#include <string_view>

/**
 * @brief IPv4 network arithmetic used by network synthesis, CIDR lookups
 * and DHCP validation.
 *
 * Thin wrapper over boost::asio::ip::network_v4 that normalises to the
 * network address (host bits cleared) on construction.
 */
class Ipv4Network {
public:
    /**
     * @brief Parses "a.b.c.d/len".
     * @param strict when true, host bits set in the address are rejected
     * @throws InvalidInputException on malformed input
     */
    [[nodiscard]] static Ipv4Network fromCidr(std::string_view cidr, bool strict = true);

    /**
     * @brief Builds the network containing @p address under @p netmask.
     * @throws InvalidInputException on malformed address or mask
     */
    [[nodiscard]] static Ipv4Network fromAddressAndNetmask(std::string_view address, std::string_view netmask);

    [[nodiscard]] static bool isValidAddress(std::string_view address) noexcept;

    [[nodiscard]] std::string networkAddress() const;
    [[nodiscard]] std::string broadcastAddress() const;
    [[nodiscard]] std::string netmask() const;
    [[nodiscard]] unsigned short prefixLength() const noexcept;
    [[nodiscard]] std::string toString() const;  // canonical "a.b.c.d/len"

    // network address + offset (offset may be negative from the broadcast side via broadcastOffset)
    [[nodiscard]] std::string networkOffset(std::uint32_t offset) const;
    [[nodiscard]] std::string broadcastOffset(std::uint32_t offset) const;

    [[nodiscard]] bool contains(std::string_view address) const;

    bool operator==(const Ipv4Network& other) const noexcept {
        return network_ == other.network_;
    }

private:
    explicit Ipv4Network(boost::asio::ip::network_v4 network) : network_(network.canonical()) {}

    boost::asio::ip::network_v4 network_;
};
