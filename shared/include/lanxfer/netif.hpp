#pragma once

#include <string>
#include <vector>

namespace lanxfer {

struct NetworkAddress {
    std::string label;        // "Ethernet (eth0)", "WiFi (wlan0)", ...
    std::string interface_name;
    std::string address;      // dotted IPv4
};

// Up, non-loopback, non link-local IPv4 addresses of this host.
std::vector<NetworkAddress> enumerate_network_addresses();

// Friendly category derived from the interface name.
std::string categorize_interface(const std::string& interface_name);

} // namespace lanxfer
