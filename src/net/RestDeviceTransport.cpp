#include "net/RestDeviceTransport.h"
#include "httplib.h"

namespace {

std::unique_ptr<httplib::Client> makeClient(const DeviceConfig& device) {
    auto client = std::make_unique<httplib::Client>(device.host, device.port);
    time_t sec = device.timeout_ms / 1000;
    time_t usec = (device.timeout_ms % 1000) * 1000;
    client->set_connection_timeout(sec, usec);
    client->set_read_timeout(sec, usec);
    if (!device.username.empty()) {
        client->set_basic_auth(device.username, device.password);
    }
    return client;
}

} // namespace

std::string commandToRestPath(const std::string& command) {
    std::string path = command;
    const std::string suffix = "/print";
    if (path.size() >= suffix.size() &&
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0) {
        path.erase(path.size() - suffix.size());
    }
    if (path.empty() || path[0] != '/') {
        path = "/" + path;
    }
    return "/rest" + path;
}

// ===================================================================
// RestDeviceSession
// ===================================================================

RestDeviceSession::RestDeviceSession(const DeviceConfig& device)
    : device_(device) {}

nlohmann::json RestDeviceSession::query(const std::string& command) {
    auto client = makeClient(device_);
    const std::string path = commandToRestPath(command);

    auto res = client->Get(path);
    if (!res) {
        throw DeviceError("request " + path + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw DeviceError("request " + path + " returned HTTP " + std::to_string(res->status));
    }

    try {
        return nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::parse_error& e) {
        throw DeviceError("invalid JSON from " + path + ": " + e.what());
    }
}

bool RestDeviceSession::probe(std::string& error) {
    auto client = makeClient(device_);
    auto res = client->Get("/rest/system/identity");
    if (!res) {
        error = httplib::to_string(res.error());
        return false;
    }
    if (res->status == 401) {
        error = "authentication failed";
        return false;
    }
    if (res->status != 200) {
        error = "HTTP " + std::to_string(res->status);
        return false;
    }
    return true;
}

// ===================================================================
// RestDeviceTransport
// ===================================================================

RestDeviceTransport::RestDeviceTransport(const std::vector<DeviceConfig>& devices, Logger& logger)
    : logger_(logger) {
    for (const auto& device : devices) {
        devices_.emplace(device.id, device);
    }
}

bool RestDeviceTransport::knowsDevice(int64_t device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.count(device_id) > 0;
}

bool RestDeviceTransport::connect(int64_t device_id) {
    DeviceConfig device;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(device_id);
        if (it == devices_.end()) {
            logger_.warn("Unknown device id " + std::to_string(device_id));
            return false;
        }
        device = it->second;
    }

    // Probe outside the lock, it may block up to timeout_ms
    auto session = std::make_shared<RestDeviceSession>(device);
    std::string error;
    if (!session->probe(error)) {
        logger_.warn("Connection to device " + std::to_string(device_id) + " (" +
                     device.host + ":" + std::to_string(device.port) + ") failed: " + error);
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(device_id);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[device_id] = session;
    return true;
}

std::shared_ptr<DeviceSession> RestDeviceTransport::getSession(int64_t device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(device_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}
