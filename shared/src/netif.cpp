#include "lanxfer/netif.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <spdlog/spdlog.h>

namespace lanxfer {

namespace {

bool starts_with_any(const std::string& s, std::initializer_list<const char*> prefixes) {
    for (const char* p : prefixes) {
        if (s.rfind(p, 0) == 0) return true;
    }
    return false;
}

} // namespace

std::string categorize_interface(const std::string& interface_name) {
    std::string n = interface_name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (starts_with_any(n, {"docker", "veth", "br-", "virbr", "vmnet", "vbox", "tap", "tun"}))
        return "Virtual";
    if (starts_with_any(n, {"wlan", "wl", "wifi", "ath"}))
        return "WiFi";
    if (starts_with_any(n, {"usb", "rndis"}))
        return "USB";
    if (starts_with_any(n, {"eth", "en", "em", "lan"}))
        return "Ethernet";
    if (starts_with_any(n, {"wwan", "ppp"}))
        return "Mobile";
    return "Network";
}

std::vector<NetworkAddress> enumerate_network_addresses() {
    std::vector<NetworkAddress> out;

    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) {
        spdlog::warn("getifaddrs failed, no interfaces listed");
        return out;
    }

    for (ifaddrs* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;

        const auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
        char buf[INET_ADDRSTRLEN] = {};
        if (!::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;

        std::string ip = buf;
        if (ip.rfind("127.", 0) == 0 || ip.rfind("169.254.", 0) == 0) continue;

        const std::string name = ifa->ifa_name ? ifa->ifa_name : "";
        out.push_back({categorize_interface(name) + " (" + name + ")", name, ip});
    }

    ::freeifaddrs(list);
    return out;
}

} // namespace lanxfer
