/**
 * @file NetworkInterfaces.cpp
 * @brief Local IPv4 address and free TCP port discovery
 */

#include "qrshare/NetworkInterfaces.h"
#include "qrshare/config.h"
#include "qrshare/Debug.h"
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace QrShare {

bool listInterfaceAddresses(std::vector<InterfaceAddress>& out, std::string& errorMsg) {
    out.clear();

    ifaddrs* ifaddr = nullptr;
    if (::getifaddrs(&ifaddr) == -1) {
        errorMsg = std::string("getifaddrs() failed: ") + std::strerror(errno);
        return false;
    }

    for (ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }

        const auto* addr = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
        char buf[INET_ADDRSTRLEN];
        if (::inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf)) == nullptr) {
            continue;
        }

        InterfaceAddress entry;
        entry.name = ifa->ifa_name ? ifa->ifa_name : "";
        entry.ipv4 = buf;
        entry.isUp = (ifa->ifa_flags & IFF_UP) != 0;
        entry.isLoopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        out.push_back(std::move(entry));
    }

    ::freeifaddrs(ifaddr);
    return true;
}

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // anonymous namespace

bool defaultRouteAddress(std::string& ip, std::string& errorMsg) {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        errorMsg = std::string("socket() failed: ") + std::strerror(errno);
        return false;
    }

    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(DEFAULT_ROUTE_TARGET_PORT);
    ::inet_pton(AF_INET, DEFAULT_ROUTE_TARGET_ADDRESS, &target.sin_addr);

    // connect() on a datagram socket only selects a route
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&target), sizeof(target)) != 0) {
        errorMsg = std::string("No default route: ") + std::strerror(errno);
        closeFd(fd);
        return false;
    }

    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) != 0) {
        errorMsg = std::string("getsockname() failed: ") + std::strerror(errno);
        closeFd(fd);
        return false;
    }
    closeFd(fd);

    char buf[INET_ADDRSTRLEN];
    if (::inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf)) == nullptr) {
        errorMsg = "inet_ntop() failed";
        return false;
    }
    ip = buf;
    return true;
}

AddressSources AddressSources::system() {
    AddressSources sources;
    sources.defaultRoute = &defaultRouteAddress;
    sources.interfaces = &listInterfaceAddresses;
    return sources;
}

bool resolveLocalIp(const std::string& interfaceHint, std::string& ip, std::string& errorMsg) {
    return resolveLocalIpFrom(AddressSources::system(), interfaceHint, ip, errorMsg);
}

bool resolveLocalIpFrom(const AddressSources& sources, const std::string& interfaceHint,
                        std::string& ip, std::string& errorMsg) {
    std::vector<InterfaceAddress> addresses;

    if (!interfaceHint.empty()) {
        if (!sources.interfaces(addresses, errorMsg)) {
            return false;
        }
        for (const auto& entry : addresses) {
            if (entry.name == interfaceHint) {
                ip = entry.ipv4;
                return true;
            }
        }
        errorMsg = "Interface '" + interfaceHint + "' not found or has no IPv4 address.";
        return false;
    }

    std::string routeError;
    if (sources.defaultRoute(ip, routeError)) {
        return true;
    }
    LOG_DEBUG("[NetworkInterfaces] " << routeError << ", falling back to interface list");

    std::string listError;
    if (!sources.interfaces(addresses, listError)) {
        errorMsg = routeError + "; " + listError;
        return false;
    }
    for (const auto& entry : addresses) {
        if (entry.isUp && !entry.isLoopback) {
            ip = entry.ipv4;
            return true;
        }
    }

    errorMsg = routeError + "; no up non-loopback IPv4 interface";
    return false;
}

bool findFreePort(uint16_t& port, std::string& errorMsg) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        errorMsg = std::string("socket() failed: ") + std::strerror(errno);
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(PORT_ANY);

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        errorMsg = std::string("bind(port=0) failed: ") + std::strerror(errno);
        closeFd(fd);
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
        errorMsg = std::string("getsockname() failed: ") + std::strerror(errno);
        closeFd(fd);
        return false;
    }
    closeFd(fd);

    port = ntohs(bound.sin_port);
    if (port == 0) {
        errorMsg = "OS returned port 0";
        return false;
    }
    return true;
}

}  // namespace QrShare
