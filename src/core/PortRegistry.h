#pragma once
#include <cstdint>
#include <optional>
#include <string>

// Well-known service for a port
struct ServiceInfo {
    std::string protocol;  // "tcp" or "udp"
    std::string name;
};

// Static lookup by port number only; absent for unregistered ports.
std::optional<ServiceInfo> lookupService(uint16_t port);
