#include "core/ConnectionStatsAggregator.h"
#include "core/IpClassifier.h"
#include "core/PortRegistry.h"
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace {

// Frequency counter that remembers first-seen order for tie-breaking
template <typename Key, typename Hash = std::hash<Key>>
class FrequencyMap {
public:
    void add(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            index_.emplace(key, entries_.size());
            entries_.emplace_back(key, 1);
        } else {
            entries_[it->second].second++;
        }
    }

    // Highest counts first; equal counts keep insertion order
    std::vector<std::pair<Key, uint64_t>> top(size_t n) const {
        auto ranked = entries_;
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        if (ranked.size() > n) {
            ranked.resize(n);
        }
        return ranked;
    }

private:
    std::unordered_map<Key, size_t, Hash> index_;
    std::vector<std::pair<Key, uint64_t>> entries_;
};

struct PortKey {
    uint16_t port;
    std::string protocol;

    bool operator==(const PortKey& other) const {
        return port == other.port && protocol == other.protocol;
    }
};

struct PortKeyHash {
    size_t operator()(const PortKey& k) const {
        return std::hash<uint16_t>()(k.port) ^ (std::hash<std::string>()(k.protocol) << 1);
    }
};

// Positive decimal port number, nullopt otherwise
std::optional<uint16_t> parsePort(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    unsigned value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    if (value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::vector<AddressRank> rankAddresses(const FrequencyMap<std::string>& counts,
                                       size_t n, uint64_t total) {
    std::vector<AddressRank> out;
    for (const auto& kv : counts.top(n)) {
        AddressRank row;
        row.ip_address = kv.first;
        row.connection_count = kv.second;
        row.percentage = percentageOf(kv.second, total);
        out.push_back(std::move(row));
    }
    return out;
}

} // namespace

double percentageOf(uint64_t count, uint64_t total) {
    if (total == 0) {
        return 0.0;
    }
    double pct = static_cast<double>(count) / static_cast<double>(total) * 100.0;
    return std::min(pct, 100.0);
}

ConnectionStatsAggregator::ConnectionStatsAggregator(size_t top_n)
    : top_n_(top_n) {
    if (top_n_ == 0) {
        throw std::invalid_argument("top_n must be greater than zero");
    }
}

ConnectionSummary ConnectionStatsAggregator::aggregate(const RecordSet& records,
                                                       std::chrono::system_clock::time_point now) const {
    ConnectionSummary summary;
    summary.last_updated = now;
    summary.total_connections = records.size();
    // the tracking table only lists live entries
    summary.active_connections = summary.total_connections;

    FrequencyMap<std::string> sources;
    FrequencyMap<std::string> destinations;
    FrequencyMap<PortKey, PortKeyHash> ports;

    for (const auto& record : records) {
        const std::string* protocol = findField(record, "protocol");

        // Protocol breakdown
        if (protocol) {
            if (*protocol == "tcp") {
                summary.tcp_connections++;
            } else if (*protocol == "udp") {
                summary.udp_connections++;
            } else if (*protocol == "icmp") {
                summary.icmp_connections++;
            }
        }

        std::string src_ip;
        if (const std::string* src = findField(record, "src-address")) {
            src_ip = stripPort(*src);
            if (!src_ip.empty()) {
                sources.add(src_ip);
            }
        }

        std::string dst_ip;
        if (const std::string* dst = findField(record, "dst-address")) {
            dst_ip = stripPort(*dst);
            if (!dst_ip.empty()) {
                destinations.add(dst_ip);
            }
        }

        if (const std::string* dst_port = findField(record, "dst-port")) {
            if (auto port = parsePort(*dst_port)) {
                ports.add(PortKey{*port, protocol ? *protocol : "unknown"});
            }
        }

        // Internal vs external, both ends required
        if (!src_ip.empty() && !dst_ip.empty()) {
            if (isPrivate(src_ip) && isPrivate(dst_ip)) {
                summary.internal_connections++;
            } else {
                summary.external_connections++;
            }
        }
    }

    summary.other_connections = summary.total_connections - summary.tcp_connections -
                                summary.udp_connections - summary.icmp_connections;

    summary.top_sources = rankAddresses(sources, top_n_, summary.total_connections);
    summary.top_destinations = rankAddresses(destinations, top_n_, summary.total_connections);

    for (const auto& kv : ports.top(top_n_)) {
        PortRank row;
        row.port = kv.first.port;
        row.protocol = kv.first.protocol;
        row.connection_count = kv.second;
        row.percentage = percentageOf(kv.second, summary.total_connections);
        if (auto service = lookupService(kv.first.port)) {
            row.service_name = service->name;
        }
        summary.top_ports.push_back(std::move(row));
    }

    return summary;
}
