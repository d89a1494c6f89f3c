#include "core/Config.h"
#include <set>
#include <stdexcept>

namespace {

template <typename T>
T valueOr(const YAML::Node& node, const char* key, const T& fallback) {
    return node[key] ? node[key].as<T>() : fallback;
}

DeviceConfig parseDevice(const YAML::Node& node) {
    if (!node["id"] || !node["host"]) {
        throw std::runtime_error("Device entry missing required 'id' or 'host'");
    }

    DeviceConfig device;
    device.id = node["id"].as<int64_t>();
    device.host = node["host"].as<std::string>();
    device.port = valueOr<uint16_t>(node, "port", 80);
    device.username = valueOr<std::string>(node, "username", "");
    device.password = valueOr<std::string>(node, "password", "");
    device.timeout_ms = valueOr<int>(node, "timeout_ms", 5000);

    if (device.timeout_ms <= 0) {
        throw std::runtime_error("Device " + std::to_string(device.id) + ": timeout_ms must be positive");
    }

    if (node["pools"]) {
        for (const auto& pool : node["pools"]) {
            std::string name = valueOr<std::string>(pool, "name", "");
            std::string ranges = valueOr<std::string>(pool, "ranges", "");
            if (!parsePoolRanges(name, ranges, device.pools)) {
                throw std::runtime_error("Device " + std::to_string(device.id) +
                                         ": invalid ranges for pool '" + name + "'");
            }
        }
    }
    return device;
}

} // namespace

const DeviceConfig* AppConfig::findDevice(int64_t id) const {
    for (const auto& device : devices) {
        if (device.id == id) {
            return &device;
        }
    }
    return nullptr;
}

AppConfig parseConfig(const YAML::Node& config) {
    AppConfig app;

    try {
        if (config["logging"]) {
            const auto& logging = config["logging"];
            app.logging.level = valueOr<std::string>(logging, "level", "info");
            app.logging.file = valueOr<std::string>(logging, "file", "");
            app.logging.timestamps = valueOr<bool>(logging, "timestamps", true);
        }

        if (config["api"]) {
            const auto& api = config["api"];
            app.api.host = valueOr<std::string>(api, "host", "localhost");
            app.api.port = valueOr<uint16_t>(api, "port", 8082);
            app.api.token = valueOr<std::string>(api, "token", "");
        }

        if (config["cache"]) {
            app.connection_ttl_seconds = valueOr<int>(config["cache"], "connection_ttl_seconds", 60);
            app.dhcp_ttl_seconds = valueOr<int>(config["cache"], "dhcp_ttl_seconds", 60);
        }

        if (config["stats"]) {
            int top_n = valueOr<int>(config["stats"], "top_n", 10);
            if (top_n <= 0) {
                throw std::runtime_error("stats.top_n must be greater than zero");
            }
            app.top_n = static_cast<size_t>(top_n);
        }

        if (config["devices"]) {
            std::set<int64_t> seen;
            for (const auto& node : config["devices"]) {
                DeviceConfig device = parseDevice(node);
                if (!seen.insert(device.id).second) {
                    throw std::runtime_error("Duplicate device id: " + std::to_string(device.id));
                }
                app.devices.push_back(std::move(device));
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid configuration: " + std::string(e.what()));
    }

    if (app.connection_ttl_seconds < 0 || app.dhcp_ttl_seconds < 0) {
        throw std::runtime_error("Cache TTL values must not be negative");
    }
    return app;
}

AppConfig loadConfigFile(const std::string& path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file: " + std::string(e.what()));
    }
    return parseConfig(config);
}
