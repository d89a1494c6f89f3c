#include "core/SummaryJson.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

nlohmann::json addressRows(const std::vector<AddressRank>& rows) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& row : rows) {
        arr.push_back({
            {"ipAddress", row.ip_address},
            {"connectionCount", row.connection_count},
            {"percentage", row.percentage}
        });
    }
    return arr;
}

} // namespace

std::string formatIso8601(std::chrono::system_clock::time_point tp) {
    auto ms_total = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    auto secs = ms_total / 1000;
    auto ms = ms_total % 1000;
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

nlohmann::json toJson(const ConnectionSummary& summary) {
    nlohmann::json ports = nlohmann::json::array();
    for (const auto& row : summary.top_ports) {
        nlohmann::json j = {
            {"port", row.port},
            {"protocol", row.protocol},
            {"connectionCount", row.connection_count},
            {"percentage", row.percentage}
        };
        if (row.service_name) {
            j["serviceName"] = *row.service_name;
        }
        ports.push_back(std::move(j));
    }

    nlohmann::json j;
    j["totalConnections"] = summary.total_connections;
    j["activeConnections"] = summary.active_connections;
    j["tcpConnections"] = summary.tcp_connections;
    j["udpConnections"] = summary.udp_connections;
    j["icmpConnections"] = summary.icmp_connections;
    j["otherConnections"] = summary.other_connections;
    j["top10Sources"] = addressRows(summary.top_sources);
    j["top10Destinations"] = addressRows(summary.top_destinations);
    j["top10Ports"] = std::move(ports);
    j["internalConnections"] = summary.internal_connections;
    j["externalConnections"] = summary.external_connections;
    j["lastUpdated"] = formatIso8601(summary.last_updated);
    return j;
}

nlohmann::json toJson(const LeaseSummary& summary) {
    nlohmann::json pools = nlohmann::json::array();
    for (const auto& row : summary.pool_ranges) {
        pools.push_back({
            {"name", row.name},
            {"start", row.start},
            {"end", row.end},
            {"size", row.size},
            {"used", row.used},
            {"availablePercentage", row.available_percentage}
        });
    }

    nlohmann::json j;
    j["totalLeases"] = summary.total_leases;
    j["activeLeases"] = summary.active_leases;
    j["usagePercentage"] = summary.usage_percentage;
    j["poolSize"] = summary.pool_size;
    j["availableIPs"] = summary.available_ips;
    j["poolRanges"] = std::move(pools);
    j["lastUpdated"] = formatIso8601(summary.last_updated);
    return j;
}
