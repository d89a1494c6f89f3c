#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/Config.h"
#include "core/DeviceTransport.h"
#include "core/Logger.h"

// Map a console command to its REST path:
//   "/ip/firewall/connection/print" -> "/rest/ip/firewall/connection"
std::string commandToRestPath(const std::string& command);

// Session against a RouterOS v7 REST endpoint (HTTP basic auth).
class RestDeviceSession : public DeviceSession {
public:
    explicit RestDeviceSession(const DeviceConfig& device);

    RestDeviceSession(const RestDeviceSession&) = delete;
    RestDeviceSession& operator=(const RestDeviceSession&) = delete;

    // Throws DeviceError on network errors, non-200 status or invalid JSON
    nlohmann::json query(const std::string& command) override;

    // GET /rest/system/identity; true on HTTP 200. `error` receives the cause otherwise.
    bool probe(std::string& error);

private:
    DeviceConfig device_;
};

// Sessions for the devices listed in the configuration
class RestDeviceTransport : public DeviceTransport {
public:
    RestDeviceTransport(const std::vector<DeviceConfig>& devices, Logger& logger);

    bool connect(int64_t device_id) override;
    std::shared_ptr<DeviceSession> getSession(int64_t device_id) override;

    bool knowsDevice(int64_t device_id) const;

private:
    std::unordered_map<int64_t, DeviceConfig> devices_;
    std::unordered_map<int64_t, std::shared_ptr<RestDeviceSession>> sessions_;
    mutable std::mutex mutex_;
    Logger& logger_;
};
