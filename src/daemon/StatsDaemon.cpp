#include "daemon/StatsDaemon.h"
#include <iostream>
#include <nlohmann/json.hpp>
#include "core/SummaryJson.h"
#include "net/RestDeviceTransport.h"

namespace {

void sendJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void sendUnavailable(httplib::Response& res, const std::string& message) {
    sendJson(res, 503, {{"success", false}, {"message", message}});
}

} // namespace

// ===================================================================
// CONSTRUCTORS
// ===================================================================

StatsDaemon::StatsDaemon(const std::string& config_path)
    : config_(loadConfigFile(config_path)), config_name_(config_path) {
    initialize(nullptr, nullptr);
}

StatsDaemon::StatsDaemon(const YAML::Node& config, const std::string& config_name)
    : config_(parseConfig(config)), config_name_(config_name) {
    initialize(nullptr, nullptr);
}

StatsDaemon::StatsDaemon(const AppConfig& config, std::unique_ptr<DeviceTransport> transport,
                         std::unique_ptr<Clock> clock)
    : config_(config), config_name_("in-memory") {
    initialize(std::move(transport), std::move(clock));
}

StatsDaemon::~StatsDaemon() {
    stop();
    stopServer();
}

void StatsDaemon::initialize(std::unique_ptr<DeviceTransport> transport, std::unique_ptr<Clock> clock) {
    /*
     * Initialization order:
     * 1. Logging
     * 2. API token check
     * 3. Device transport
     * 4. Statistics services (one per family)
     */

    // 1. Logging
    logger_ = std::make_unique<Logger>(config_.logging.level, config_.logging.file,
                                       config_.logging.timestamps);
    logger_->info("Loading configuration: " + config_name_);

    // 2. API token (required)
    if (config_.api.token.empty()) {
        throw std::runtime_error("Config missing 'api.token' required");
    }

    // 3. Transport
    clock_ = clock ? std::move(clock) : std::make_unique<SystemClock>();
    if (transport) {
        transport_ = std::move(transport);
    } else {
        transport_ = std::make_unique<RestDeviceTransport>(config_.devices, *logger_);
    }
    logger_->info("Managing " + std::to_string(config_.devices.size()) + " device(s)");

    // 4. Services
    connection_stats_ = std::make_unique<ConnectionStatsService>(
        *transport_, *clock_, *logger_,
        std::chrono::seconds(config_.connection_ttl_seconds), config_.top_n);
    dhcp_stats_ = std::make_unique<DhcpStatsService>(
        *transport_, *clock_, *logger_, std::chrono::seconds(config_.dhcp_ttl_seconds));

    for (const auto& device : config_.devices) {
        if (!device.pools.empty()) {
            dhcp_stats_->setConfiguredPools(device.id, device.pools);
        }
    }

    logger_->info("StatsDaemon initialized successfully");
}

// ===================================================================
// RUN / STOP
// ===================================================================

void StatsDaemon::run() {
    running_.store(true);
    logger_->info("StatsDaemon is running...");

    startServer();

    while (running_.load() && running_signal_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    logger_->info("Daemon shutting down...");
    stopServer();
    running_.store(false);
}

void StatsDaemon::stop() {
    if (!running_.load()) return;

    logger_->info("StatsDaemon is stopping...");
    running_.store(false);
}

// ===================================================================
// SETUP API ROUTES
// ===================================================================

void StatsDaemon::setupApiRoutes() {
    // GET /health - liveness, no auth
    svr_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        sendJson(res, 200, {{"status", "ok"}});
    });

    // GET /api/devices/{id}/connection-stats
    svr_.Get(R"(/api/devices/(-?\d+)/connection-stats)", [this](const httplib::Request& req, httplib::Response& res) {
        int64_t device_id = 0;
        if (!parseDeviceId(req, res, device_id)) return;

        try {
            auto stats = connection_stats_->getConnectionStats(device_id);
            if (!stats) {
                sendUnavailable(res, "connection statistics unavailable for device " + std::to_string(device_id));
                return;
            }
            sendJson(res, 200, {{"success", true}, {"data", toJson(*stats)}});
        } catch (const std::exception& ex) {
            logger_->error("connection-stats request failed: " + std::string(ex.what()));
            sendJson(res, 500, {{"success", false}, {"message", "internal server error"}});
        }
    });

    // GET /api/devices/{id}/dhcp-stats
    svr_.Get(R"(/api/devices/(-?\d+)/dhcp-stats)", [this](const httplib::Request& req, httplib::Response& res) {
        int64_t device_id = 0;
        if (!parseDeviceId(req, res, device_id)) return;

        try {
            auto stats = dhcp_stats_->getDHCPStats(device_id);
            if (!stats) {
                sendUnavailable(res, "DHCP statistics unavailable for device " + std::to_string(device_id));
                return;
            }
            sendJson(res, 200, {{"success", true}, {"data", toJson(*stats)}});
        } catch (const std::exception& ex) {
            logger_->error("dhcp-stats request failed: " + std::string(ex.what()));
            sendJson(res, 500, {{"success", false}, {"message", "internal server error"}});
        }
    });

    // POST /api/devices/{id}/cache/clear - drop both families for one device
    svr_.Post(R"(/api/devices/(-?\d+)/cache/clear)", [this](const httplib::Request& req, httplib::Response& res) {
        int64_t device_id = 0;
        if (!parseDeviceId(req, res, device_id)) return;

        connection_stats_->clearCache(device_id);
        dhcp_stats_->clearCache(device_id);
        logger_->info("Cache cleared for device " + std::to_string(device_id));
        sendJson(res, 200, {{"success", true}});
    });

    // POST /api/cache/clear - drop everything
    svr_.Post("/api/cache/clear", [this](const httplib::Request& req, httplib::Response& res) {
        if (!isAuthorized(req)) {
            logAuthFailure(req);
            sendJson(res, 401, {{"error", "unauthorized"}});
            return;
        }
        connection_stats_->clearAllCache();
        dhcp_stats_->clearAllCache();
        logger_->info("All caches cleared");
        sendJson(res, 200, {{"success", true}});
    });
}

void StatsDaemon::startServer() {
    logger_->info("Starting API server on " + config_.api.host + ":" + std::to_string(config_.api.port));

    setupApiRoutes();

    api_thread_ = std::thread([this]() {
        svr_.listen(config_.api.host, config_.api.port);
    });

    // Await server response
    auto start = std::chrono::steady_clock::now();
    while (!svr_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        // Timeout after 5 seconds
        if (std::chrono::steady_clock::now() - start > std::chrono::seconds(5)) {
            throw std::runtime_error("API server failed to start within 5 seconds");
        }
    }

    logger_->info("API server is now listening");
}

void StatsDaemon::stopServer() {
    if (!api_thread_.joinable()) return;

    logger_->info("Stopping API server...");
    svr_.stop();
    api_thread_.join();
}

// ===================================================================
// HELPER METHODS
// ===================================================================

bool StatsDaemon::isAuthorized(const httplib::Request& req) const {
    const std::string bearer = "Bearer ";
    auto header = req.get_header_value("Authorization");
    if (header.compare(0, bearer.size(), bearer) == 0 &&
        header.substr(bearer.size()) == config_.api.token) {
        return true;
    }
    return req.has_param("token") && req.get_param_value("token") == config_.api.token;
}

void StatsDaemon::logAuthFailure(const httplib::Request& req) {
    logger_->warn("AUTH FAIL: " + req.method + " " + req.path + " from " + req.remote_addr);
}

bool StatsDaemon::parseDeviceId(const httplib::Request& req, httplib::Response& res, int64_t& device_id) {
    if (!isAuthorized(req)) {
        logAuthFailure(req);
        sendJson(res, 401, {{"error", "unauthorized"}});
        return false;
    }

    try {
        device_id = std::stoll(req.matches[1].str());
    } catch (const std::exception&) {
        sendJson(res, 400, {{"success", false}, {"message", "invalid device id"}});
        return false;
    }

    if (!config_.findDevice(device_id)) {
        sendJson(res, 404, {{"success", false}, {"message", "unknown device " + std::to_string(device_id)}});
        return false;
    }
    return true;
}

// ===================================================================
// SIGNAL HANDLING
// ===================================================================

std::atomic<bool> StatsDaemon::running_signal_{true};

void StatsDaemon::signalHandler(int signum) {
    std::cout << "\n[INFO] Signal (" << signum << ") received. Shutting down..." << std::endl;
    running_signal_ = false;
}
