#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <yaml-cpp/yaml.h>
#include "httplib.h"
#include "core/Clock.h"
#include "core/Config.h"
#include "core/ConnectionStatsService.h"
#include "core/DeviceTransport.h"
#include "core/DhcpStatsService.h"
#include "core/Logger.h"

// HTTP front end over the statistics services
class StatsDaemon {
public:
    // Production: load YAML config from file
    explicit StatsDaemon(const std::string& config_path);
    // In-memory config (tests)
    StatsDaemon(const YAML::Node& config, const std::string& config_name);
    // Explicit transport (tests); clock defaults to the system clock
    StatsDaemon(const AppConfig& config, std::unique_ptr<DeviceTransport> transport,
                std::unique_ptr<Clock> clock = nullptr);
    ~StatsDaemon();

    StatsDaemon(const StatsDaemon&) = delete;
    StatsDaemon& operator=(const StatsDaemon&) = delete;

    void run();
    void stop();
    void setRunning(bool value) { running_ = value; }
    bool isRunning() const { return running_.load(); }
    static void signalHandler(int signum);

    ConnectionStatsService& connectionStats() { return *connection_stats_; }
    DhcpStatsService& dhcpStats() { return *dhcp_stats_; }

private:
    void initialize(std::unique_ptr<DeviceTransport> transport, std::unique_ptr<Clock> clock);
    void setupApiRoutes();
    void startServer();
    void stopServer();
    bool isAuthorized(const httplib::Request& req) const;
    void logAuthFailure(const httplib::Request& req);
    bool parseDeviceId(const httplib::Request& req, httplib::Response& res, int64_t& device_id);

    AppConfig config_;
    std::string config_name_;
    std::unique_ptr<Logger> logger_;
    std::unique_ptr<Clock> clock_;
    std::unique_ptr<DeviceTransport> transport_;
    std::unique_ptr<ConnectionStatsService> connection_stats_;
    std::unique_ptr<DhcpStatsService> dhcp_stats_;

    std::atomic<bool> running_{false};
    static std::atomic<bool> running_signal_;
    std::thread api_thread_;
    httplib::Server svr_;
};
