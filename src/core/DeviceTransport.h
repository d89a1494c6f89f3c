#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

// Raised by a session when a command cannot be executed
class DeviceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Open session to one device
class DeviceSession {
public:
    virtual ~DeviceSession() = default;
    // Run a read-only command, e.g. "/ip/firewall/connection/print".
    // Returns the raw response; throws DeviceError on failure.
    virtual nlohmann::json query(const std::string& command) = 0;
};

// Session provider for managed devices
class DeviceTransport {
public:
    virtual ~DeviceTransport() = default;
    // Acquire (or refresh) a session; false when the device cannot be reached
    virtual bool connect(int64_t device_id) = 0;
    // Current session or nullptr
    virtual std::shared_ptr<DeviceSession> getSession(int64_t device_id) = 0;
};

