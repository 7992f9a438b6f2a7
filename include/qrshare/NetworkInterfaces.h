/**
 * @file NetworkInterfaces.h
 * @brief Local IPv4 address and free TCP port discovery
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace QrShare {

/**
 * @brief One IPv4 address assigned to a local interface
 */
struct InterfaceAddress {
    std::string name;    ///< Interface name, e.g. "eth0"
    std::string ipv4;    ///< Dotted quad
    bool isUp = false;
    bool isLoopback = false;
};

/**
 * @brief Enumerate IPv4 addresses of all local interfaces (getifaddrs order)
 * @param out Output list
 * @param errorMsg Output error message
 * @return true if enumeration succeeded (the list may still be empty)
 */
bool listInterfaceAddresses(std::vector<InterfaceAddress>& out, std::string& errorMsg);

/**
 * @brief Source address the kernel picks for a route towards DEFAULT_ROUTE_TARGET_ADDRESS
 *
 * A UDP socket is "connected" and getsockname() reports the local address of
 * the default route. No packet is sent.
 */
bool defaultRouteAddress(std::string& ip, std::string& errorMsg);

/**
 * @brief Lookups used by resolveLocalIp()
 */
struct AddressSources {
    std::function<bool(std::string& ip, std::string& errorMsg)> defaultRoute;
    std::function<bool(std::vector<InterfaceAddress>& out, std::string& errorMsg)> interfaces;

    /**
     * @brief Sources backed by the kernel routing table and getifaddrs()
     */
    static AddressSources system();
};

/**
 * @brief Resolve the IPv4 address to advertise in the share URL
 *
 * With an interface name: the first IPv4 address of that interface, whatever
 * its state; an error if the interface is unknown or has no IPv4 address.
 *
 * Without one: the default-route source address. Only when there is no
 * default route, the first up, non-loopback IPv4 interface.
 *
 * @param interfaceHint Interface name or empty for automatic selection
 * @param ip Output address
 * @param errorMsg Output error message
 * @return true if an address was found
 */
bool resolveLocalIp(const std::string& interfaceHint, std::string& ip, std::string& errorMsg);

/**
 * @brief resolveLocalIp() over explicit lookups
 */
bool resolveLocalIpFrom(const AddressSources& sources, const std::string& interfaceHint,
                        std::string& ip, std::string& errorMsg);

/**
 * @brief Ask the OS for a free TCP port on all interfaces
 *
 * Binds port 0, reads the assigned port back and closes the socket. Another
 * process may take the port before it is bound again.
 */
bool findFreePort(uint16_t& port, std::string& errorMsg);

}  // namespace QrShare
