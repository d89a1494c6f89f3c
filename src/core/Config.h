#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include "core/DhcpStatsAggregator.h"

struct LoggingConfig {
    std::string level = "info";
    std::string file;          // empty: stdout
    bool timestamps = true;
};

struct ApiConfig {
    std::string host = "localhost";
    uint16_t port = 8082;
    std::string token;
};

// One managed router reachable over the RouterOS REST API
struct DeviceConfig {
    int64_t id = 0;
    std::string host;
    uint16_t port = 80;
    std::string username;
    std::string password;
    int timeout_ms = 5000;
    std::vector<PoolRange> pools;  // empty: read pools from the device
};

struct AppConfig {
    LoggingConfig logging;
    ApiConfig api;
    int connection_ttl_seconds = 60;
    int dhcp_ttl_seconds = 60;
    size_t top_n = 10;
    std::vector<DeviceConfig> devices;

    const DeviceConfig* findDevice(int64_t id) const;
};

// Throws std::runtime_error on missing or invalid settings
AppConfig parseConfig(const YAML::Node& config);
AppConfig loadConfigFile(const std::string& path);
