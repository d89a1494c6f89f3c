#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include "httplib.h"

// Minimal RouterOS REST endpoint on localhost for integration tests.
// Serves canned bodies per path and enforces basic auth.
class FakeRouter {
public:
    FakeRouter(int port, std::string username, std::string password)
        : port_(port), username_(std::move(username)), password_(std::move(password)) {
        svr_.Get(R"(/rest/.*)", [this](const httplib::Request& req, httplib::Response& res) {
            hits_++;
            if (!checkAuth(req)) {
                res.status = 401;
                res.set_content(R"({"error":401,"message":"Unauthorized"})", "application/json");
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = bodies_.find(req.path);
            if (it == bodies_.end()) {
                res.status = 404;
                res.set_content(R"({"error":404,"message":"Not Found"})", "application/json");
                return;
            }
            res.set_content(it->second, "application/json");
        });

        setBody("/rest/system/identity", R"({"name":"MikroTik"})");

        thread_ = std::thread([this]() { svr_.listen("127.0.0.1", port_); });
        auto start = std::chrono::steady_clock::now();
        while (!svr_.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            if (std::chrono::steady_clock::now() - start > std::chrono::seconds(5)) {
                throw std::runtime_error("fake router failed to start");
            }
        }
    }

    ~FakeRouter() {
        svr_.stop();
        if (thread_.joinable()) thread_.join();
    }

    void setBody(const std::string& path, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        bodies_[path] = body;
    }

    int hits() const { return hits_.load(); }

private:
    bool checkAuth(const httplib::Request& req) const {
        auto expected = httplib::make_basic_authentication_header(username_, password_);
        return req.get_header_value("Authorization") == expected.second;
    }

    int port_;
    std::string username_;
    std::string password_;
    std::map<std::string, std::string> bodies_;
    std::mutex mutex_;
    std::atomic<int> hits_{0};
    httplib::Server svr_;
    std::thread thread_;
};
