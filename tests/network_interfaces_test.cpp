#include <gtest/gtest.h>
#include "qrshare/NetworkInterfaces.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <string>
#include <vector>

using namespace QrShare;

namespace {

bool isDottedQuad(const std::string& ip) {
    in_addr addr{};
    return ::inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

}  // namespace

TEST(NetworkInterfacesTest, ListsLoopback) {
    std::vector<InterfaceAddress> addresses;
    std::string err;
    ASSERT_TRUE(listInterfaceAddresses(addresses, err)) << err;

    bool sawLoopback = false;
    for (const auto& a : addresses) {
        EXPECT_TRUE(isDottedQuad(a.ipv4)) << a.ipv4;
        if (a.isLoopback) {
            sawLoopback = true;
        }
    }
    EXPECT_TRUE(sawLoopback);
}

TEST(NetworkInterfacesTest, NamedInterfaceResolvesToItsAddress) {
    std::vector<InterfaceAddress> addresses;
    std::string err;
    ASSERT_TRUE(listInterfaceAddresses(addresses, err)) << err;
    ASSERT_FALSE(addresses.empty());

    std::string ip;
    ASSERT_TRUE(resolveLocalIp(addresses.front().name, ip, err)) << err;
    EXPECT_EQ(ip, addresses.front().ipv4);
}

TEST(NetworkInterfacesTest, UnknownInterfaceIsAnError) {
    std::string ip;
    std::string err;
    EXPECT_FALSE(resolveLocalIp("qrshare-no-such-if0", ip, err));
    EXPECT_NE(err.find("qrshare-no-such-if0"), std::string::npos);
}

TEST(NetworkInterfacesTest, AutomaticSelectionUsesDefaultRoute) {
    std::string routeIp;
    std::string err;
    if (!defaultRouteAddress(routeIp, err)) {
        GTEST_SKIP() << "No default route in this environment: " << err;
    }
    EXPECT_TRUE(isDottedQuad(routeIp)) << routeIp;

    std::string ip;
    ASSERT_TRUE(resolveLocalIp("", ip, err)) << err;
    EXPECT_EQ(ip, routeIp);
}

namespace {

// Interface list where the first non-loopback entry is a bridge, as on
// hosts running containers
AddressSources recordingSources(std::vector<std::string>& calls, bool routeAvailable) {
    AddressSources sources;
    sources.defaultRoute = [&calls, routeAvailable](std::string& ip, std::string& err) {
        calls.push_back("route");
        if (!routeAvailable) {
            err = "No default route: Network is unreachable";
            return false;
        }
        ip = "192.168.1.20";
        return true;
    };
    sources.interfaces = [&calls](std::vector<InterfaceAddress>& out, std::string&) {
        calls.push_back("interfaces");
        out = {
            {"lo", "127.0.0.1", true, true},
            {"docker0", "172.17.0.1", true, false},
            {"wlan0", "192.168.1.20", true, false},
        };
        return true;
    };
    return sources;
}

}  // namespace

TEST(NetworkInterfacesTest, DefaultRouteIsConsultedBeforeInterfaceList) {
    std::vector<std::string> calls;
    std::string ip;
    std::string err;
    ASSERT_TRUE(resolveLocalIpFrom(recordingSources(calls, true), "", ip, err)) << err;

    EXPECT_EQ(ip, "192.168.1.20");
    EXPECT_EQ(calls, std::vector<std::string>{"route"});
}

TEST(NetworkInterfacesTest, InterfaceListIsFallbackWithoutDefaultRoute) {
    std::vector<std::string> calls;
    std::string ip;
    std::string err;
    ASSERT_TRUE(resolveLocalIpFrom(recordingSources(calls, false), "", ip, err)) << err;

    EXPECT_EQ(ip, "172.17.0.1");
    EXPECT_EQ(calls, (std::vector<std::string>{"route", "interfaces"}));
}

TEST(NetworkInterfacesTest, InterfaceHintSkipsDefaultRoute) {
    std::vector<std::string> calls;
    std::string ip;
    std::string err;
    ASSERT_TRUE(resolveLocalIpFrom(recordingSources(calls, true), "wlan0", ip, err)) << err;

    EXPECT_EQ(ip, "192.168.1.20");
    EXPECT_EQ(calls, std::vector<std::string>{"interfaces"});
}

TEST(NetworkInterfacesTest, NoRouteAndOnlyLoopbackIsAnError) {
    AddressSources sources;
    sources.defaultRoute = [](std::string&, std::string& err) {
        err = "No default route";
        return false;
    };
    sources.interfaces = [](std::vector<InterfaceAddress>& out, std::string&) {
        out = {{"lo", "127.0.0.1", true, true}};
        return true;
    };

    std::string ip;
    std::string err;
    EXPECT_FALSE(resolveLocalIpFrom(sources, "", ip, err));
    EXPECT_NE(err.find("No default route"), std::string::npos);
}

TEST(NetworkInterfacesTest, FreePortIsNonZeroAndBindable) {
    uint16_t port = 0;
    std::string err;
    ASSERT_TRUE(findFreePort(port, err)) << err;
    EXPECT_NE(port, 0u);

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);
    EXPECT_EQ(::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)), 0);
    ::close(fd);
}
