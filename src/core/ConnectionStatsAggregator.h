#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/Records.h"

struct AddressRank {
    std::string ip_address;
    uint64_t connection_count = 0;
    double percentage = 0.0;
};

struct PortRank {
    uint16_t port = 0;
    std::string protocol;
    uint64_t connection_count = 0;
    double percentage = 0.0;
    std::optional<std::string> service_name;
};

// Summary of one connection-tracking snapshot
struct ConnectionSummary {
    uint64_t total_connections = 0;
    uint64_t active_connections = 0;
    // protocol breakdown, buckets sum to total_connections
    uint64_t tcp_connections = 0;
    uint64_t udp_connections = 0;
    uint64_t icmp_connections = 0;
    uint64_t other_connections = 0;

    std::vector<AddressRank> top_sources;
    std::vector<AddressRank> top_destinations;
    std::vector<PortRank> top_ports;

    // only records with both addresses present are classified
    uint64_t internal_connections = 0;
    uint64_t external_connections = 0;

    std::chrono::system_clock::time_point last_updated;
};

class ConnectionStatsAggregator {
public:
    explicit ConnectionStatsAggregator(size_t top_n = 10);

    // Reduce a connection-tracking snapshot into a summary stamped with `now`.
    // Records missing a field only skip the buckets that need that field.
    ConnectionSummary aggregate(const RecordSet& records,
                                std::chrono::system_clock::time_point now) const;

    size_t topN() const { return top_n_; }

private:
    size_t top_n_;
};

// count / total * 100, or 0 when total is 0
double percentageOf(uint64_t count, uint64_t total);
